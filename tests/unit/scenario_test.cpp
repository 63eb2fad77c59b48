#include <gtest/gtest.h>
#include "contagion/components/color.hpp"
#include "contagion/core/constants.hpp"
#include "contagion/core/coordinates.hpp"
#include "contagion/core/scenario_manager.hpp"

using SimulatorConstants::SimulationType;

TEST(ScenarioTest, NamesRoundTrip) {
    for (auto s : SimulatorConstants::getAllScenarios()) {
        auto found = SimulatorConstants::scenarioFromName(SimulatorConstants::getScenarioName(s));
        ASSERT_TRUE(found.has_value());
        EXPECT_EQ(*found, s);
    }
    EXPECT_FALSE(SimulatorConstants::scenarioFromName("PANDEMIC").has_value());
}

TEST(ScenarioTest, ManagerListsEveryScenario) {
    ScenarioManager manager;
    manager.buildScenarioList();

    const auto& list = manager.getScenarioList();
    ASSERT_EQ(list.size(), SimulatorConstants::getAllScenarios().size());
    EXPECT_EQ(list.front().first, SimulationType::OUTBREAK);
    EXPECT_EQ(list.front().second, "OUTBREAK");
}

TEST(ScenarioTest, EveryScenarioSeedsAValidModel) {
    ScenarioManager manager;
    for (auto s : SimulatorConstants::getAllScenarios()) {
        auto scenario = manager.createScenario(s);
        ASSERT_NE(scenario, nullptr);
        EXPECT_EQ(scenario->getName(), SimulatorConstants::getScenarioName(s));

        ScenarioConfig const cfg = scenario->getConfig();
        auto model = scenario->createModel(42u);
        ASSERT_NE(model, nullptr);

        Census const counts = model->census();
        EXPECT_EQ(counts.total(), cfg.PopulationSize);
        EXPECT_EQ(counts.infected, cfg.InfectedCount);
        EXPECT_EQ(counts.immune, cfg.ImmuneCount);
        EXPECT_EQ(model->config().RecoveryPeriod, cfg.world.RecoveryPeriod);
    }
}

TEST(ScenarioTest, ManagerCreatesCurrentScenario) {
    ScenarioManager manager;
    manager.setCurrentScenario(SimulationType::HERD_IMMUNITY);
    EXPECT_EQ(manager.getCurrentScenario(), SimulationType::HERD_IMMUNITY);

    auto model = manager.createModel(1u);
    EXPECT_EQ(model->census().immune, 60);
}

TEST(ScenarioTest, StationaryScenarioEventuallyCompletes) {
    ScenarioManager manager;
    manager.setCurrentScenario(SimulationType::STATIONARY);
    auto model = manager.createModel(8u);

    // Without movement every chain of infection is bounded by the population
    const int limit = (model->config().RecoveryPeriod + 1) * static_cast<int>(model->size());
    while (!model->isComplete() && model->time() < limit) {
        model->tick();
    }
    EXPECT_TRUE(model->isComplete());
}

TEST(ScenarioTest, ColorTags) {
    EXPECT_EQ(Components::colorFromTag("gray"), Components::Color(128, 128, 128));
    EXPECT_EQ(Components::colorFromTag("red"), Components::Color(220, 40, 40));
    EXPECT_EQ(Components::colorFromTag("green"), Components::Color(40, 200, 80));
    EXPECT_EQ(Components::colorFromTag("none"), Components::Color(255, 255, 255));
}

TEST(ScenarioTest, CoordinatesMapWorldOntoScreen) {
    WorldConfig world;  // [-200, 200] on both axes
    Simulation::Coordinates coords(world, 600);

    EXPECT_DOUBLE_EQ(coords.getPixelsPerUnit(), 1.5);
    EXPECT_DOUBLE_EQ(coords.worldToScreenX(world.MinX), 0.0);
    EXPECT_DOUBLE_EQ(coords.worldToScreenX(world.MaxX), 600.0);
    // y grows downwards on screen
    EXPECT_DOUBLE_EQ(coords.worldToScreenY(world.MaxY), 0.0);
    EXPECT_DOUBLE_EQ(coords.worldToScreenY(world.MinY), 600.0);
    EXPECT_DOUBLE_EQ(coords.worldToPixels(10.0), 15.0);
}

TEST(ScenarioTest, CoordinatesFitTheLongerWorldSide) {
    WorldConfig world;
    world.MinX = 0.0;
    world.MaxX = 300.0;
    world.MinY = -50.0;
    world.MaxY = 50.0;
    Simulation::Coordinates const coords(world, 600);

    EXPECT_DOUBLE_EQ(coords.getPixelsPerUnit(), 2.0);
    EXPECT_DOUBLE_EQ(coords.worldToScreenX(300.0), 600.0);
    EXPECT_DOUBLE_EQ(coords.worldToScreenY(-50.0), 200.0);
}
