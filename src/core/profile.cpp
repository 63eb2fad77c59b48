/**
 * @file profile.cpp
 * @brief Implementation of the scoped profiler described in profile.hpp
 */

#include "contagion/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::instance() {
    static thread_local Profiler profiler;
    return profiler;
}

void Profiler::startSection(const std::string& name) {
    auto& self = instance();
    auto& stats = self.sections[name];

    std::string parent;
    if (!self.open.empty()) {
        parent = self.open.back().name;
    }

    if (stats.calls == 0 && stats.parent.empty() && !parent.empty()) {
        stats.parent = parent;
        auto& siblings = self.sections[parent].children;
        if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
            siblings.push_back(name);
        }
    }

    self.open.push_back({name, Clock::now()});
}

void Profiler::endSection(const std::string& name) {
    auto& self = instance();

    if (self.open.empty() || self.open.back().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open scope.\n";
        return;
    }

    Duration const elapsed =
        std::chrono::duration_cast<Duration>(Clock::now() - self.open.back().started);
    self.open.pop_back();

    auto& stats = self.sections[name];
    stats.total += elapsed;
    stats.longest = std::max(stats.longest, elapsed);
    stats.calls += 1;
}

const Profiler::SectionStats* Profiler::find(const std::string& name) {
    auto& self = instance();
    auto it = self.sections.find(name);
    if (it == self.sections.end()) {
        return nullptr;
    }
    return &it->second;
}

void Profiler::printStats(std::ostream& out) {
    auto& self = instance();

    Duration rootTotal{0};
    std::vector<std::string> roots;
    for (const auto& [name, stats] : self.sections) {
        if (stats.parent.empty()) {
            roots.push_back(name);
            rootTotal += stats.total;
        }
    }

    out << "\nProfiling Statistics:\n";
    for (const auto& root : roots) {
        printSection(out, root, "", rootTotal);
    }
}

void Profiler::printSection(std::ostream& out, const std::string& name,
                            const std::string& indent, Duration rootTotal) {
    const auto& stats = instance().sections.at(name);

    double share = 0.0;
    if (rootTotal.count() > 0) {
        share = (static_cast<double>(stats.total.count()) * 100.0) /
                static_cast<double>(rootTotal.count());
    }
    auto const totalUs = std::chrono::duration_cast<std::chrono::microseconds>(stats.total).count();
    auto const longestUs = std::chrono::duration_cast<std::chrono::microseconds>(stats.longest).count();

    out << indent << name << " [" << stats.calls << " calls] "
        << totalUs << "us total, " << longestUs << "us max ("
        << std::fixed << std::setprecision(2) << share << "%)\n";

    for (const auto& child : stats.children) {
        printSection(out, child, indent + "  ", rootTotal);
    }
}

void Profiler::reset() {
    auto& self = instance();
    self.sections.clear();
    self.open.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : sectionName(std::move(name))
{
    Profiler::startSection(sectionName);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(sectionName);
}

} // namespace Profiling
