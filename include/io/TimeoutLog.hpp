#pragma once

#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

#include "core/DataStructs.hpp"

namespace IsoLinkage {

/**
 * @brief Append-only record of regions abandoned because of their deadline.
 *
 * One line per timeout:
 * ```
 * TimeOut (30s): chr1	12000	56000	2024-05-01 10:22:03
 * ```
 * Every entry is opened, appended and flushed on its own, so the file
 * survives a later fatal error.
 */
class TimeoutLog {
public:
    static constexpr const char* kDefaultFileName = "timeout.log";

    explicit TimeoutLog(const std::string& path);

    /**
     * @brief Appends one timeout entry.
     * @throws ResourceError if the log cannot be written.
     */
    void record(const Region& region, std::chrono::milliseconds deadline);

    const std::string& path() const { return path_; }

    static std::string format_entry(const Region& region, std::chrono::milliseconds deadline, std::time_t when);

    /**
     * @brief "30s" for whole seconds, "0.25s" otherwise.
     */
    static std::string format_deadline(std::chrono::milliseconds deadline);

private:
    std::string path_;
    std::mutex mutex_;
};

}  // namespace IsoLinkage
