#include <gtest/gtest.h>
#include "contagion/core/cell.hpp"
#include "contagion/core/debug.hpp"
#include "contagion/systems/boundary.hpp"
#include "contagion/systems/contact.hpp"
#include "contagion/systems/movement.hpp"

using namespace Systems;

class SystemsTest : public ::testing::Test {
protected:
    entt::registry registry;
    Population population;
    WorldConfig config;

    // Helper to create a cell
    entt::entity createCell(double x, double y, double dx, double dy) {
        auto entity = registry.create();
        registry.emplace<Cell>(entity, Point(x, y), Point(dx, dy));
        population.push_back(entity);
        return entity;
    }

    void SetUp() override {
        config.CellRadius = 10.0;
        config.RecoveryPeriod = 2;
        EpidemicStats::reset();
    }
};

TEST_F(SystemsTest, MovementAdvancesEveryCell) {
    auto a = createCell(0.0, 0.0, 1.0, 2.0);
    auto b = createCell(5.0, 5.0, -1.0, 0.0);

    MovementSystem movement;
    movement.setWorldConfig(config);
    movement.update(registry, population);

    EXPECT_EQ(registry.get<Cell>(a).location, Point(1.0, 2.0));
    EXPECT_EQ(registry.get<Cell>(b).location, Point(4.0, 5.0));
}

TEST_F(SystemsTest, MovementUsesConfiguredRecoveryPeriod) {
    auto a = createCell(0.0, 0.0, 0.0, 0.0);
    registry.get<Cell>(a).contractDisease();

    MovementSystem movement;
    movement.setWorldConfig(config);

    movement.update(registry, population);
    movement.update(registry, population);
    EXPECT_TRUE(registry.get<Cell>(a).isInfected());
    EXPECT_EQ(EpidemicStats::getRecoveries(), 0);

    movement.update(registry, population);
    EXPECT_TRUE(registry.get<Cell>(a).isImmune());
    EXPECT_EQ(EpidemicStats::getRecoveries(), 1);
}

TEST_F(SystemsTest, BoundaryReflectsOutOfBoundsCells) {
    auto inside = createCell(0.0, 0.0, 1.0, 1.0);
    auto outside = createCell(config.MaxX + 3.0, config.MinY - 3.0, 4.0, -4.0);

    BoundarySystem boundary;
    boundary.setWorldConfig(config);
    boundary.update(registry, population);

    const auto& in = registry.get<Cell>(inside);
    EXPECT_EQ(in.location, Point(0.0, 0.0));
    EXPECT_EQ(in.direction, Point(1.0, 1.0));

    const auto& out = registry.get<Cell>(outside);
    EXPECT_EQ(out.location, Point(config.MaxX, config.MinY));
    EXPECT_EQ(out.direction, Point(-4.0, 4.0));
}

TEST_F(SystemsTest, EnforceBoundsReportsBounce) {
    Cell onEdge(Point(config.MaxX, config.MaxY), Point(1.0, 1.0));
    EXPECT_FALSE(BoundarySystem::enforceBounds(onEdge, config));
    EXPECT_EQ(onEdge.direction, Point(1.0, 1.0));

    Cell past(Point(config.MinX - 0.1, 0.0), Point(-1.0, 0.0));
    EXPECT_TRUE(BoundarySystem::enforceBounds(past, config));
    EXPECT_DOUBLE_EQ(past.direction.x, 1.0);
}

TEST_F(SystemsTest, ContactInfectsNeighboursWithinRadius) {
    auto carrier = createCell(0.0, 0.0, 0.0, 0.0);
    auto near = createCell(0.0, 9.0, 0.0, 0.0);
    auto far = createCell(0.0, -30.0, 0.0, 0.0);
    registry.get<Cell>(carrier).contractDisease();

    ContactSystem contact;
    contact.setWorldConfig(config);
    contact.update(registry, population);

    EXPECT_TRUE(registry.get<Cell>(near).isInfected());
    EXPECT_TRUE(registry.get<Cell>(far).isVulnerable());
    EXPECT_EQ(EpidemicStats::getContacts(), 1);
    EXPECT_EQ(EpidemicStats::getInfections(), 1);
}

TEST_F(SystemsTest, ContactCountsEveryClosePairOnce) {
    createCell(0.0, 0.0, 0.0, 0.0);
    createCell(1.0, 0.0, 0.0, 0.0);
    createCell(2.0, 0.0, 0.0, 0.0);

    ContactSystem contact;
    contact.setWorldConfig(config);
    contact.update(registry, population);

    EXPECT_EQ(EpidemicStats::getContacts(), 3);
    EXPECT_EQ(EpidemicStats::getInfections(), 0);
}
