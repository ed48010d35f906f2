// -*- c++ -*-
// Profiling of the numerical hot paths (quadrature, Newton inversion)
//
// Timers record only in DEBUG builds; elsewhere BCEP_PROFILE_SCOPE expands to
// nothing and the operators stay free of shared state.

#ifndef BCEP_PROFILING__H
#define BCEP_PROFILING__H

#include <algorithm>
#include <chrono>
#include <climits>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Bcep {
namespace Profiling {

class ScopedTimer {
   public:
    explicit ScopedTimer(const char* name)
        : name_(name)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

   private:
    const char* name_;
    std::chrono::steady_clock::time_point start_;
};

// Process-wide collector. Operators may run on many threads at once, so every
// access to the table is serialized.
class Profiler {
   public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    void record(const std::string& name, long microseconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) {
            return;
        }
        auto& entry = stats_[name];
        entry.total_time += microseconds;
        entry.call_count++;
        entry.min_time = std::min(entry.min_time, microseconds);
        entry.max_time = std::max(entry.max_time, microseconds);
    }

    void enable() {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = true;
    }
    void disable() {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = false;
    }
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.clear();
    }

    [[nodiscard]] long call_count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stats_.find(name);
        return it == stats_.end() ? 0 : it->second.call_count;
    }

    void report(std::ostream& os = std::cerr) const {
        std::vector<std::pair<std::string, Stats>> rows;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            rows.assign(stats_.begin(), stats_.end());
        }
        if (rows.empty()) {
            return;
        }
        std::sort(rows.begin(), rows.end(),
                  [](const auto& a, const auto& b) { return a.second.total_time > b.second.total_time; });

        os << "\n=== bcep profile ===" << std::endl;
        os << std::left << std::setw(32) << "Scope"
           << std::right << std::setw(12) << "Calls"
           << std::setw(15) << "Total (ms)"
           << std::setw(15) << "Avg (us)"
           << std::setw(15) << "Max (us)" << std::endl;
        os << std::string(89, '-') << std::endl;
        for (const auto& row : rows) {
            const auto& s = row.second;
            os << std::left << std::setw(32) << row.first
               << std::right << std::setw(12) << s.call_count
               << std::setw(15) << std::fixed << std::setprecision(3) << s.total_time / 1000.0
               << std::setw(15) << std::fixed << std::setprecision(1)
               << static_cast<double>(s.total_time) / static_cast<double>(s.call_count)
               << std::setw(15) << s.max_time << std::endl;
        }
    }

   private:
    struct Stats {
        long total_time = 0;
        long call_count = 0;
        long min_time = LONG_MAX;
        long max_time = 0;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Stats> stats_;
    bool enabled_ = false;

    Profiler() = default;
    ~Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;
};

inline ScopedTimer::~ScopedTimer() {
    auto elapsed = std::chrono::steady_clock::now() - start_;
    Profiler::instance().record(name_, std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

}  // namespace Profiling
}  // namespace Bcep

#ifdef DEBUG
#define BCEP_PROFILE_CONCAT_INNER(a, b) a##b
#define BCEP_PROFILE_CONCAT(a, b) BCEP_PROFILE_CONCAT_INNER(a, b)
#define BCEP_PROFILE_SCOPE(name) \
    ::Bcep::Profiling::ScopedTimer BCEP_PROFILE_CONCAT(bcep_profile_timer_, __LINE__)(name)
#else
#define BCEP_PROFILE_SCOPE(name) ((void)0)
#endif

#endif  // BCEP_PROFILING__H
