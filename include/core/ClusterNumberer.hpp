#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace IsoLinkage {

/**
 * @brief Issues run-global cluster identifiers "c_1", "c_2", ...
 *
 * The only mutable state shared between regions. Backed by an atomic
 * counter so ids stay unique and gap-free whatever the processing order.
 */
class ClusterNumberer {
public:
    ClusterNumberer() = default;

    ClusterNumberer(const ClusterNumberer&) = delete;
    ClusterNumberer& operator=(const ClusterNumberer&) = delete;

    /**
     * @brief Returns the next identifier. Thread-safe, strictly monotonic, starts at c_1.
     */
    std::string next() {
        uint64_t n = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
        return format(n);
    }

    /**
     * @brief Number of identifiers issued so far.
     */
    uint64_t issued() const { return counter_.load(std::memory_order_relaxed); }

    static std::string format(uint64_t n) { return "c_" + std::to_string(n); }

private:
    std::atomic<uint64_t> counter_{0};
};

}  // namespace IsoLinkage
