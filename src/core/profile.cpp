/**
 * @file profile.cpp
 * @brief Implementation of the scope timer described in profile.hpp
 */

#include "astrofield/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];

    section.start_time = Clock::now();
    if (section.profile_data.call_count == 0 && !instance.scope_stack.empty()) {
        section.profile_data.parent_name = instance.scope_stack.back();
    }
    instance.scope_stack.push_back(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.scope_stack.empty() || instance.scope_stack.back() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open scope.\n";
        return;
    }
    instance.scope_stack.pop_back();

    auto& data = instance.sections[name].profile_data;
    Duration const duration = Clock::now() - instance.sections[name].start_time;
    data.total_time += duration;
    data.max_time = std::max(data.max_time, duration);
    data.call_count += 1;
}

void Profiler::printStats() {
    auto& instance = getInstance();

    std::vector<std::pair<std::string, ProfileData>> rows;
    rows.reserve(instance.sections.size());
    for (const auto& [name, section] : instance.sections) {
        rows.emplace_back(name, section.profile_data);
    }
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second.total_time > b.second.total_time;
    });

    std::cout << "\nProfiling Statistics:\n";
    for (const auto& [name, pd] : rows) {
        double const totalMs = std::chrono::duration<double, std::milli>(pd.total_time).count();
        double const maxMs = std::chrono::duration<double, std::milli>(pd.max_time).count();
        double const avgMs = pd.call_count > 0 ? totalMs / static_cast<double>(pd.call_count) : 0.0;
        std::cout << "  " << std::left << std::setw(24) << name
                  << " [" << pd.call_count << " calls] "
                  << std::fixed << std::setprecision(3)
                  << totalMs << "ms total, " << avgMs << "ms avg, " << maxMs << "ms max";
        if (!pd.parent_name.empty()) {
            std::cout << " (in " << pd.parent_name << ")";
        }
        std::cout << "\n";
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack.clear();
}

uint64_t Profiler::callCount(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? 0 : it->second.profile_data.call_count;
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
