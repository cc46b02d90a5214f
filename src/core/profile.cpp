/**
 * @file profile.cpp
 * @brief Implementation of the scope timer described in profile.hpp
 */

#include "gunpong/core/profile.hpp"

#include <iomanip>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, Duration duration) {
    auto& section = getInstance().sections[name];
    section.total_time += duration;
    section.call_count += 1;
    if (duration < section.min_time) {
        section.min_time = duration;
    }
    if (duration > section.max_time) {
        section.max_time = duration;
    }
}

void Profiler::printStats(std::ostream& out) {
    using std::chrono::duration_cast;
    using Micros = std::chrono::duration<double, std::micro>;

    out << "\n[Profiler] Frame statistics:\n";
    for (const auto& [name, pd] : getInstance().sections) {
        if (pd.call_count == 0) {
            continue;
        }
        double const avgUs = duration_cast<Micros>(pd.total_time).count() / static_cast<double>(pd.call_count);
        out << "  " << std::left << std::setw(28) << name << std::right
            << " [" << pd.call_count << " calls] "
            << std::fixed << std::setprecision(2)
            << "avg " << avgUs << "us, "
            << "min " << duration_cast<Micros>(pd.min_time).count() << "us, "
            << "max " << duration_cast<Micros>(pd.max_time).count() << "us\n";
    }
}

Profiler::SectionStats Profiler::stats(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    if (it == sections.end()) {
        return {};
    }
    return it->second;
}

void Profiler::reset() {
    getInstance().sections.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
    , start_time(Profiler::Clock::now())
{}

ScopedProfiler::~ScopedProfiler() {
    Profiler::record(section_name, Profiler::Clock::now() - start_time);
}

} // namespace Profiling
