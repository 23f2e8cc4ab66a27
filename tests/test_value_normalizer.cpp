#include "hr/ValueNormalizer.hpp"
#include "app/Errors.hpp"
#include "fakes.hpp"
#include <cassert>
#include <iostream>

static bool rejects(const NormalizeConfig& cfg) {
    try {
        ValueNormalizer n(cfg);
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "Testing ValueNormalizer..." << std::endl;

    // Test 1: linear mapping
    {
        std::cout << "Test 1: linear mapping over [40, 180]" << std::endl;

        ValueNormalizer n(NormalizeConfig{});
        NormalizedValue v = n.normalize(75);
        assert(near(v.value, 35.0 / 140.0));
        assert(near(v.value, 0.25));
        assert(!v.clampedLow && !v.clampedHigh);

        v = n.normalize(40);
        assert(v.value == 0.0f && !v.clampedLow);
        v = n.normalize(180);
        assert(v.value == 1.0f && !v.clampedHigh);
        v = n.normalize(110);
        assert(near(v.value, 0.5));

        std::cout << "  linear mapping test passed" << std::endl;
    }

    // Test 2: clamping
    {
        std::cout << "Test 2: clamping" << std::endl;

        ValueNormalizer n(NormalizeConfig{});
        NormalizedValue v = n.normalize(30);
        assert(v.value == 0.0f && v.clampedLow && !v.clampedHigh);
        v = n.normalize(0);
        assert(v.value == 0.0f && v.clampedLow);
        v = n.normalize(220);
        assert(v.value == 1.0f && v.clampedHigh && !v.clampedLow);
        v = n.normalize(65535);
        assert(v.value == 1.0f && v.clampedHigh);

        std::cout << "  clamping test passed" << std::endl;
    }

    // Test 3: bounded and monotonic for both modes
    {
        std::cout << "Test 3: monotonic in bpm" << std::endl;

        NormalizeConfig linear;
        NormalizeConfig wait;
        wait.mode = NormalizeMode::WaitTime;

        for (const auto& cfg : {linear, wait}) {
            ValueNormalizer n(cfg);
            float prev = -1.0f;
            for (uint32_t bpm = 0; bpm <= 400; ++bpm) {
                const NormalizedValue v = n.normalize(bpm);
                assert(v.value >= 0.0f && v.value <= 1.0f);
                assert(v.value >= prev);
                prev = v.value;
            }
        }

        std::cout << "  monotonic test passed" << std::endl;
    }

    // Test 4: wait_time mode
    {
        std::cout << "Test 4: wait_time mapping" << std::endl;

        NormalizeConfig cfg;
        cfg.mode = NormalizeMode::WaitTime;
        ValueNormalizer n(cfg);

        // 60 bpm: 0.2 / (1.0 - 0.2) = 0.25
        NormalizedValue v = n.normalize(60);
        assert(near(v.value, 0.25));
        // 120 bpm: 0.2 / (0.5 - 0.2) = 0.666..
        v = n.normalize(120);
        assert(near(v.value, 2.0 / 3.0));
        // 150 bpm: 0.2 / (0.4 - 0.2) = 1.0
        v = n.normalize(150);
        assert(near(v.value, 1.0) && !v.clampedLow);
        // period shorter than hr_flex
        v = n.normalize(300);
        assert(v.value == 1.0f && v.clampedHigh);
        v = n.normalize(0);
        assert(v.value == 0.0f && v.clampedLow);

        std::cout << "  wait_time mapping test passed" << std::endl;
    }

    // Test 5: degenerate configuration
    {
        std::cout << "Test 5: configuration errors" << std::endl;

        NormalizeConfig cfg;
        cfg.min_bpm = 100;
        cfg.max_bpm = 100;
        assert(rejects(cfg));
        cfg.max_bpm = 90;
        assert(rejects(cfg));

        NormalizeConfig wait;
        wait.mode = NormalizeMode::WaitTime;
        wait.hr_const = 0.0;
        assert(rejects(wait));
        wait.hr_const = 0.2;
        wait.hr_flex = -0.1;
        assert(rejects(wait));

        // range is irrelevant in wait_time mode
        wait.hr_flex = 0.2;
        wait.min_bpm = 100;
        wait.max_bpm = 100;
        assert(!rejects(wait));

        std::cout << "  configuration error test passed" << std::endl;
    }

    std::cout << "All ValueNormalizer tests passed!" << std::endl;
    return 0;
}
