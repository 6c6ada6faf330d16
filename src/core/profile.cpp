/**
 * @file profile.cpp
 * @brief Implementation of the profiling system described in profile.hpp
 */

#include "poolshot/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Profiling {

// ------------------ Profiler Singleton Methods ------------------

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const char* name, Duration duration) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> const lock(instance.mutex);

    auto& data = instance.sections[name];
    data.total_time += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);
}

std::optional<Profiler::ProfileData> Profiler::getStats(const std::string& name) {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> const lock(instance.mutex);

    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Profiler::printStats() {
    auto& instance = getInstance();
    std::vector<std::pair<std::string, ProfileData>> rows;
    {
        std::lock_guard<std::mutex> const lock(instance.mutex);
        rows.assign(instance.sections.begin(), instance.sections.end());
    }

    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second.total_time > b.second.total_time;
    });

    std::cout << "\nProfiling Statistics:\n";
    for (const auto& [name, pd] : rows) {
        double const totalUs = std::chrono::duration<double, std::micro>(pd.total_time).count();
        double const avgUs   = pd.call_count > 0 ? totalUs / static_cast<double>(pd.call_count) : 0.0;
        double const minUs   = std::chrono::duration<double, std::micro>(pd.min_time).count();
        double const maxUs   = std::chrono::duration<double, std::micro>(pd.max_time).count();

        std::cout << "  " << name << " [" << pd.call_count << " calls] "
                  << std::fixed << std::setprecision(2)
                  << totalUs << "us (avg: " << avgUs
                  << "us, min: " << minUs
                  << "us, max: " << maxUs << "us)\n";
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    std::lock_guard<std::mutex> const lock(instance.mutex);
    instance.sections.clear();
}

// ------------------ ScopedProfiler RAII Wrapper ------------------

ScopedProfiler::ScopedProfiler(const char* name)
    : section_name(name)
    , start_time(Profiler::Clock::now())
{
}

ScopedProfiler::~ScopedProfiler() {
    try {
        Profiler::record(section_name, Profiler::Clock::now() - start_time);
    } catch (const std::exception& e) {
        std::cerr << "[Profiler] dropped sample for " << section_name << ": " << e.what() << "\n";
    }
}

} // namespace Profiling
