#include "hr/ValueNormalizer.hpp"
#include "app/Errors.hpp"
#include <cmath>
#include <string>

static NormalizedValue clampUnit(double v) {
    NormalizedValue out;
    if (!(v > 0.0)) {            // also catches NaN
        out.value = 0.0f;
        out.clampedLow = v < 0.0 || std::isnan(v);
    } else if (v > 1.0) {
        out.value = 1.0f;
        out.clampedHigh = true;
    } else {
        out.value = static_cast<float>(v);
    }
    return out;
}

ValueNormalizer::ValueNormalizer(const NormalizeConfig& cfg) : cfg_(cfg) {
    switch (cfg_.mode) {
    case NormalizeMode::Linear:
        if (!(cfg_.max_bpm > cfg_.min_bpm)) {
            throw ConfigurationError("normalize: max_bpm (" + std::to_string(cfg_.max_bpm) +
                                     ") must be greater than min_bpm (" +
                                     std::to_string(cfg_.min_bpm) + ")");
        }
        break;
    case NormalizeMode::WaitTime:
        if (!(cfg_.hr_const > 0.0)) {
            throw ConfigurationError("normalize: hr_const must be positive");
        }
        if (cfg_.hr_flex < 0.0) {
            throw ConfigurationError("normalize: hr_flex must not be negative");
        }
        break;
    }
}

NormalizedValue ValueNormalizer::normalize(uint32_t bpm) const {
    const double b = static_cast<double>(bpm);
    switch (cfg_.mode) {
    case NormalizeMode::Linear:   return linear(b);
    case NormalizeMode::WaitTime: return waitTime(b);
    }
    return linear(b);
}

NormalizedValue ValueNormalizer::linear(double bpm) const {
    if (bpm < cfg_.min_bpm) {
        NormalizedValue out;
        out.clampedLow = true;
        return out;
    }
    return clampUnit((bpm - cfg_.min_bpm) / (cfg_.max_bpm - cfg_.min_bpm));
}

NormalizedValue ValueNormalizer::waitTime(double bpm) const {
    if (bpm <= 0.0) {
        NormalizedValue out;
        out.clampedLow = true;
        return out;
    }
    const double slack = 60.0 / bpm - cfg_.hr_flex;
    if (slack <= 0.0) {
        NormalizedValue out;
        out.value = 1.0f;
        out.clampedHigh = true;
        return out;
    }
    return clampUnit(cfg_.hr_const / slack);
}
