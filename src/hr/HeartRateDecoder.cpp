#include "hr/HeartRateDecoder.hpp"
#include "app/Errors.hpp"
#include <string>

static uint16_t readLe16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static void requireBytes(std::size_t len, std::size_t needed, const char* field) {
    if (len < needed) {
        throw MalformedPayload(std::string("heart rate measurement truncated at ") + field +
                               " (need " + std::to_string(needed) +
                               " bytes, got " + std::to_string(len) + ")");
    }
}

HeartRateMeasurement decodeMeasurement(const uint8_t* data, std::size_t len) {
    if (!data || len == 0) {
        throw MalformedPayload("empty heart rate measurement");
    }

    HeartRateMeasurement m;
    m.flags = data[0];
    std::size_t off = 1;

    if (m.flags & hrm::kFlagHr16Bit) {
        requireBytes(len, off + 2, "heart rate (uint16)");
        m.heartRateBpm = readLe16(data + off);
        off += 2;
    } else {
        requireBytes(len, off + 1, "heart rate (uint8)");
        m.heartRateBpm = data[off];
        off += 1;
    }

    if (m.flags & hrm::kFlagContactSupported) {
        m.sensorContact = (m.flags & hrm::kFlagContactDetected) != 0;
    }

    if (m.flags & hrm::kFlagEnergyExpended) {
        requireBytes(len, off + 2, "energy expended");
        m.energyExpended = readLe16(data + off);
        off += 2;
    }

    if (m.flags & hrm::kFlagRrIntervals) {
        // a stray odd byte at the end is ignored
        const std::size_t count = (len - off) / 2;
        m.rrIntervals.reserve(count);
        for (std::size_t i = 0; i < count; ++i, off += 2) {
            m.rrIntervals.push_back(readLe16(data + off));
        }
    }

    return m;
}

HeartRateMeasurement decodeMeasurement(const std::vector<uint8_t>& bytes) {
    return decodeMeasurement(bytes.data(), bytes.size());
}

SensorReading decodeHeartRate(const std::vector<uint8_t>& bytes,
                              std::chrono::steady_clock::time_point timestamp) {
    const HeartRateMeasurement m = decodeMeasurement(bytes);
    SensorReading r;
    r.heartRateBpm = m.heartRateBpm;
    r.sensorContact = m.sensorContact;
    r.timestamp = timestamp;
    return r;
}
