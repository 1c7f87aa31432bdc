#include "core/Cancellation.hpp"

#include "core/Errors.hpp"

namespace IsoLinkage {

// ==================================================
// CancellationToken Implementation
// ==================================================

bool CancellationToken::expired() const {
    if (!deadline_at_) {
        return false;
    }
    if (fired_.load(std::memory_order_acquire)) {
        return true;
    }
    return Clock::now() >= *deadline_at_;
}

bool CancellationToken::stop_requested() const {
    return stop_requested_ && stop_requested_();
}

void CancellationToken::throw_if_cancelled() const {
    if (expired()) {
        fired_.store(true, std::memory_order_release);
        throw RegionTimeout(budget_);
    }
    if (stop_requested()) {
        throw RegionCancelled();
    }
}

const CancellationToken& CancellationToken::none() {
    static const CancellationToken token;
    return token;
}

// ==================================================
// RegionTimer Implementation
// ==================================================

RegionTimer::RegionTimer(std::optional<std::chrono::milliseconds> deadline, std::function<bool()> stop_requested)
    : deadline_(deadline) {
    token_.stop_requested_ = std::move(stop_requested);
}

void RegionTimer::arm() {
    if (!deadline_ || state_ != State::IDLE) {
        return;
    }
    token_.budget_ = *deadline_;
    token_.deadline_at_ = CancellationToken::Clock::now() + *deadline_;
    state_ = State::ARMED;
}

RegionTimer::State RegionTimer::disarm() {
    if (state_ == State::ARMED) {
        if (token_.expired()) {
            token_.fired_.store(true, std::memory_order_release);
            state_ = State::FIRED;
        } else {
            state_ = State::DISARMED;
        }
        // Stop ticking: the deadline no longer applies once the region is done.
        token_.deadline_at_.reset();
    } else if (state_ == State::IDLE) {
        state_ = State::DISARMED;
    }
    return state_;
}

RegionTimer::State RegionTimer::state() const {
    if (state_ == State::ARMED && token_.fired()) {
        return State::FIRED;
    }
    return state_;
}

const char* RegionTimer::state_to_string(State s) {
    switch (s) {
        case State::IDLE: return "IDLE";
        case State::ARMED: return "ARMED";
        case State::FIRED: return "FIRED";
        case State::DISARMED: return "DISARMED";
    }
    return "UNKNOWN";
}

}  // namespace IsoLinkage
