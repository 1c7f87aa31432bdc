#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace IsoLinkage {
namespace Utils {

/**
 * @brief Wall-clock and (with jemalloc) heap statistics for a run or a test.
 */
class ResourceMonitor {
public:
    ResourceMonitor() { reset(); }

    void reset() { start_time_ = std::chrono::steady_clock::now(); }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    /**
     * @brief Bytes currently allocated, 0 without jemalloc.
     */
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // advance the epoch to refresh cached stats
        uint64_t epoch = 1;
        size_t epoch_sz = sizeof(epoch);
        mallctl("epoch", &epoch, &epoch_sz, &epoch, sizeof(epoch));
        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#endif
        return allocated;
    }

    std::string format_stats(const std::string& label) const {
        std::ostringstream ss;
        ss << "[" << label << "] Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s";
#ifdef USE_JEMALLOC
        ss << ", Memory: " << std::fixed << std::setprecision(2) << (get_memory_usage() / 1024.0 / 1024.0) << " MB";
#else
        ss << " (jemalloc not enabled)";
#endif
        return ss.str();
    }

    void print_stats(const std::string& label = "Execution") const { std::cout << format_stats(label) << std::endl; }

private:
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace IsoLinkage
