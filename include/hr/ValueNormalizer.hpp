#pragma once
#include "app/Config.hpp"
#include <cstdint>

struct NormalizedValue {
    float value = 0.0f;
    bool clampedLow = false;
    bool clampedHigh = false;
};

// Maps bpm onto [0, 1], linearly or with the wait-time curve. Out-of-range
// input is clamped and flagged. Throws ConfigurationError for bad settings.
class ValueNormalizer {
public:
    explicit ValueNormalizer(const NormalizeConfig& cfg);

    NormalizedValue normalize(uint32_t bpm) const;

    const NormalizeConfig& config() const { return cfg_; }

private:
    NormalizedValue linear(double bpm) const;
    NormalizedValue waitTime(double bpm) const;

    NormalizeConfig cfg_;
};
