#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace IsoLinkage {

/**
 * @brief Raised when a region exceeds its deadline.
 *
 * The only recoverable error: RegionScheduler discards the region and moves on.
 */
class RegionTimeout : public std::runtime_error {
public:
    explicit RegionTimeout(std::chrono::milliseconds deadline)
        : std::runtime_error("Region deadline exceeded (" + std::to_string(deadline.count()) + " ms)"),
          deadline_(deadline) {}

    std::chrono::milliseconds deadline() const { return deadline_; }

private:
    std::chrono::milliseconds deadline_;
};

/**
 * @brief Raised inside a region that must stop because the run is shutting down.
 */
class RegionCancelled : public std::runtime_error {
public:
    RegionCancelled() : std::runtime_error("Region cancelled by shutdown") {}
};

/**
 * @brief Output directory or stream could not be created, opened or flushed.
 */
class ResourceError : public std::runtime_error {
public:
    explicit ResourceError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Failure inside a region/element/transcript collaborator.
 */
class CollaboratorError : public std::runtime_error {
public:
    explicit CollaboratorError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace IsoLinkage
