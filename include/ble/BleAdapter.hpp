#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class StopSignal;

// Heart Rate Service and Heart Rate Measurement characteristic.
constexpr const char* kHeartRateServiceUuid     = "0000180d-0000-1000-8000-00805f9b34fb";
constexpr const char* kHeartRateMeasurementUuid = "00002a37-0000-1000-8000-00805f9b34fb";

struct DeviceHandle {
    std::string address;
    std::string name;
    std::string objectPath;   // adapter specific, e.g. BlueZ D-Bus path
};

// A live GATT connection. Released with BleAdapter::disconnect.
class GattLink {
public:
    virtual ~GattLink() = default;
    virtual const DeviceHandle& device() const = 0;
};

// Finite sequence of raw notification frames for one subscription.
// Not restartable: a new subscription yields a new stream.
class NotificationStream {
public:
    enum class Status { Frame, Timeout, Ended };
    enum class EndReason { None, StreamClosed, DeviceDisconnected };

    virtual ~NotificationStream() = default;

    // Waits up to waitFor for the next frame.
    virtual Status next(std::vector<uint8_t>& frame, std::chrono::milliseconds waitFor) = 0;
    virtual EndReason endReason() const = 0;
};

// The BLE stack as the session sees it.
class BleAdapter {
public:
    virtual ~BleAdapter() = default;

    // Looks for a heart rate sensor whose name or address matches pattern
    // (empty = any). Returns nullopt on timeout or stop. Throws ConnectError
    // when the adapter itself is unavailable.
    virtual std::optional<DeviceHandle> scan(const std::string& pattern,
                                             std::chrono::milliseconds timeout,
                                             const StopSignal& stop) = 0;

    // Throws ConnectError. Returns early when stop fires; the caller still
    // releases the returned link.
    virtual std::unique_ptr<GattLink> connect(const DeviceHandle& device,
                                              const StopSignal& stop) = 0;

    // Enables notifications on characteristicUuid. Throws ConnectError.
    virtual std::unique_ptr<NotificationStream> subscribe(GattLink& link,
                                                          const std::string& characteristicUuid) = 0;

    virtual void disconnect(GattLink& link) = 0;
};

// Case-insensitive regex search on name or address; empty pattern matches all.
// Throws ConfigurationError for an invalid regex.
bool deviceMatches(const DeviceHandle& device, const std::string& pattern);
