#include "app/Backoff.hpp"
#include <algorithm>
#include <cmath>

std::chrono::milliseconds Backoff::nextDelay() {
    const unsigned n = attempt_++;
    if (cfg_.kind == BackoffKind::Fixed) return cfg_.initial;

    const double raw = static_cast<double>(cfg_.initial.count()) * std::pow(cfg_.multiplier, n);
    const double capped = std::min(raw, static_cast<double>(cfg_.max.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}
