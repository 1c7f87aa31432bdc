#include "io/TimeoutLog.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include "core/Errors.hpp"

namespace IsoLinkage {

TimeoutLog::TimeoutLog(const std::string& path) : path_(path) {
}

std::string TimeoutLog::format_deadline(std::chrono::milliseconds deadline) {
    std::ostringstream oss;
    if (deadline.count() % 1000 == 0) {
        oss << deadline.count() / 1000 << "s";
    } else {
        oss << static_cast<double>(deadline.count()) / 1000.0 << "s";
    }
    return oss.str();
}

std::string TimeoutLog::format_entry(const Region& region, std::chrono::milliseconds deadline, std::time_t when) {
    std::tm time_info{};
    localtime_r(&when, &time_info);

    std::ostringstream oss;
    oss << "TimeOut (" << format_deadline(deadline) << "): "
        << region.chrom << "\t"
        << region.start << "\t"
        << region.end << "\t"
        << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S") << "\n";
    return oss.str();
}

void TimeoutLog::record(const Region& region, std::chrono::milliseconds deadline) {
    const std::string entry = format_entry(region, deadline, std::time(nullptr));

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream ofs(path_, std::ios::app);
    if (!ofs.is_open()) {
        throw ResourceError("Cannot open timeout log: " + path_);
    }
    ofs << entry;
    ofs.flush();
    if (!ofs.good()) {
        throw ResourceError("Cannot write timeout log: " + path_);
    }
}

}  // namespace IsoLinkage
