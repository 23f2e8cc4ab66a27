#pragma once
#include "app/Config.hpp"
#include <chrono>

// Delay generator for reconnect attempts.
//   fixed:       initial, initial, initial, ...
//   exponential: initial, initial*m, initial*m^2, ... capped at max
class Backoff {
public:
    explicit Backoff(const BackoffConfig& cfg) : cfg_(cfg) {}

    // Delay before the next attempt; advances the attempt counter.
    std::chrono::milliseconds nextDelay();

    void reset() { attempt_ = 0; }
    unsigned attempt() const { return attempt_; }

private:
    BackoffConfig cfg_;
    unsigned attempt_ = 0;
};
