#pragma once
#include "ble/BleAdapter.hpp"
#include <condition_variable>
#include <mutex>
#include <optional>

// Single-slot handoff from the BLE event thread to the session thread.
// A newer frame replaces one that was not picked up yet.
class NotificationMailbox {
public:
    // Returns false if an unread frame was overwritten.
    bool push(std::vector<uint8_t> frame);
    // First call wins; later pushes are ignored.
    void end(NotificationStream::EndReason why);

    NotificationStream::Status next(std::vector<uint8_t>& frame, std::chrono::milliseconds waitFor);
    NotificationStream::EndReason endReason() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::optional<std::vector<uint8_t>> pending_;
    bool ended_ = false;
    NotificationStream::EndReason reason_ = NotificationStream::EndReason::None;
};
