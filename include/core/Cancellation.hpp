#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>

namespace IsoLinkage {

/**
 * @brief Cooperative cancellation signal handed to collaborator calls.
 *
 * A token is owned by exactly one region task. It becomes cancelled when
 * its deadline elapses (RegionTimeout) or when the scheduler's stop
 * predicate reports a shutdown (RegionCancelled). Collaborators must call
 * throw_if_cancelled() regularly; nothing preempts them.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief A token that never cancels.
     */
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief True once the deadline (if any) has passed.
     */
    bool expired() const;

    /**
     * @brief True if the scheduler asked this region to stop.
     */
    bool stop_requested() const;

    /**
     * @brief Throws RegionTimeout after the deadline, RegionCancelled on shutdown.
     *
     * The first RegionTimeout latches the token into the fired state.
     */
    void throw_if_cancelled() const;

    /**
     * @brief Whether a RegionTimeout was raised or the deadline was observed expired.
     */
    bool fired() const { return fired_.load(std::memory_order_acquire); }

    /**
     * @brief Shared never-cancelling token for callers without a deadline.
     */
    static const CancellationToken& none();

private:
    friend class RegionTimer;

    std::optional<Clock::time_point> deadline_at_;
    std::chrono::milliseconds budget_{0};
    std::function<bool()> stop_requested_;
    mutable std::atomic<bool> fired_{false};
};

/**
 * @brief Per-region single-shot deadline.
 *
 * States: IDLE -> ARMED -> {FIRED, DISARMED}. A timer without a configured
 * deadline never leaves IDLE on arm() and disarm() reports DISARMED.
 * Each region constructs its own timer, so no deadline can leak into the
 * next region.
 */
class RegionTimer {
public:
    enum class State { IDLE, ARMED, FIRED, DISARMED };

    explicit RegionTimer(std::optional<std::chrono::milliseconds> deadline,
                         std::function<bool()> stop_requested = {});

    RegionTimer(const RegionTimer&) = delete;
    RegionTimer& operator=(const RegionTimer&) = delete;

    /**
     * @brief IDLE -> ARMED, only if a deadline is configured.
     */
    void arm();

    /**
     * @brief Ends the timer and returns the terminal state.
     *
     * DISARMED if the region finished before its deadline, FIRED otherwise.
     */
    State disarm();

    State state() const;

    bool expired() const { return token_.expired(); }

    const CancellationToken& token() const { return token_; }

    std::optional<std::chrono::milliseconds> deadline() const { return deadline_; }

    static const char* state_to_string(State s);

private:
    std::optional<std::chrono::milliseconds> deadline_;
    State state_ = State::IDLE;
    CancellationToken token_;
};

}  // namespace IsoLinkage
