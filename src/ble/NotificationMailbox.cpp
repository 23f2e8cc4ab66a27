#include "ble/NotificationMailbox.hpp"

bool NotificationMailbox::push(std::vector<uint8_t> frame) {
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (ended_) return true;
        replaced = pending_.has_value();
        pending_ = std::move(frame);
    }
    cv_.notify_one();
    return !replaced;
}

void NotificationMailbox::end(NotificationStream::EndReason why) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (ended_) return;
        ended_ = true;
        reason_ = why;
    }
    cv_.notify_all();
}

NotificationStream::Status NotificationMailbox::next(std::vector<uint8_t>& frame,
                                                     std::chrono::milliseconds waitFor) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, waitFor, [this] { return pending_.has_value() || ended_; });
    if (pending_) {
        frame = std::move(*pending_);
        pending_.reset();
        return NotificationStream::Status::Frame;
    }
    return ended_ ? NotificationStream::Status::Ended : NotificationStream::Status::Timeout;
}

NotificationStream::EndReason NotificationMailbox::endReason() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reason_;
}
