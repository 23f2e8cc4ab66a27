#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Heart Rate Measurement (0x2A37), little-endian: flags, hr (u8 or u16),
// optional energy (u16), optional RR list (u16, 1/1024 s).
// Throws MalformedPayload when the payload is shorter than the flags imply.

namespace hrm {
constexpr uint8_t kFlagHr16Bit          = 0x01;
constexpr uint8_t kFlagContactDetected  = 0x02;
constexpr uint8_t kFlagContactSupported = 0x04;
constexpr uint8_t kFlagEnergyExpended   = 0x08;
constexpr uint8_t kFlagRrIntervals      = 0x10;
}

struct HeartRateMeasurement {
    uint8_t flags = 0;
    uint16_t heartRateBpm = 0;
    std::optional<bool> sensorContact;     // empty if the sensor has no contact detection
    std::optional<uint16_t> energyExpended;
    std::vector<uint16_t> rrIntervals;
};

// The part of a measurement that travels downstream.
struct SensorReading {
    uint16_t heartRateBpm = 0;
    std::optional<bool> sensorContact;
    std::chrono::steady_clock::time_point timestamp;
};

HeartRateMeasurement decodeMeasurement(const uint8_t* data, std::size_t len);
HeartRateMeasurement decodeMeasurement(const std::vector<uint8_t>& bytes);

SensorReading decodeHeartRate(const std::vector<uint8_t>& bytes,
                              std::chrono::steady_clock::time_point timestamp);
