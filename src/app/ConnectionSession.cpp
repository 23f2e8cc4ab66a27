#include "app/ConnectionSession.hpp"
#include "app/Errors.hpp"
#include "app/StopSignal.hpp"
#include "hr/HeartRateDecoder.hpp"
#include "hr/ValueNormalizer.hpp"
#include "osc/OscEmitter.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

using namespace std::chrono_literals;
using namespace session;

static constexpr auto kNotificationPoll = 200ms;

namespace {

// Legal successors of each state. Every state needs an overload here.
struct TransitionCheck {
    const ConnectionState& to;

    bool operator()(const Idle&) const {
        return std::holds_alternative<Scanning>(to);
    }
    bool operator()(const Scanning&) const {
        return std::holds_alternative<Connecting>(to) || std::holds_alternative<Failed>(to);
    }
    bool operator()(const Connecting&) const {
        return std::holds_alternative<Subscribed>(to) || std::holds_alternative<Failed>(to);
    }
    bool operator()(const Subscribed&) const {
        return std::holds_alternative<Disconnected>(to);
    }
    bool operator()(const Disconnected&) const { return false; }
    bool operator()(const Failed&) const { return false; }
};

struct Describe {
    std::string operator()(const Idle&) const { return "Idle"; }
    std::string operator()(const Scanning&) const { return "Scanning"; }
    std::string operator()(const Connecting& s) const {
        return "Connecting(" + s.device.name + " " + s.device.address + ")";
    }
    std::string operator()(const Subscribed& s) const {
        return "Subscribed(" + s.device.name + " " + s.device.address + ")";
    }
    std::string operator()(const Disconnected& s) const {
        return std::string("Disconnected(") + to_string(s.reason) +
               (s.detail.empty() ? "" : ": " + s.detail) + ")";
    }
    std::string operator()(const Failed& s) const {
        return std::string("Failed(") + to_string(s.reason) +
               (s.detail.empty() ? "" : ": " + s.detail) + ")";
    }
};

// Owns the GATT link and hands it back to the adapter on every exit path.
class GattLinkGuard {
public:
    explicit GattLinkGuard(BleAdapter& ble) : ble_(ble) {}
    ~GattLinkGuard() { release(); }

    GattLinkGuard(const GattLinkGuard&) = delete;
    GattLinkGuard& operator=(const GattLinkGuard&) = delete;

    void adopt(std::unique_ptr<GattLink> link) {
        release();
        link_ = std::move(link);
    }

    GattLink& link() { return *link_; }

    void release() {
        if (!link_) return;
        try {
            ble_.disconnect(*link_);
        } catch (const std::exception& e) {
            std::cerr << "[session] disconnect failed: " << e.what() << "\n";
        }
        link_.reset();
    }

private:
    BleAdapter& ble_;
    std::unique_ptr<GattLink> link_;
};

std::string regexEscape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

const char* stateName(const ConnectionState& s) {
    static const char* const names[] = {
        "Idle", "Scanning", "Connecting", "Subscribed", "Disconnected", "Failed"};
    return names[s.index()];
}

std::string describe(const ConnectionState& s) {
    return std::visit(Describe{}, s);
}

bool isTerminal(const ConnectionState& s) {
    return std::holds_alternative<Disconnected>(s) || std::holds_alternative<Failed>(s);
}

bool isLegalTransition(const ConnectionState& from, const ConnectionState& to) {
    return std::visit(TransitionCheck{to}, from);
}

const char* to_string(DisconnectReason r) {
    switch (r) {
    case DisconnectReason::StreamEnded:        return "stream ended";
    case DisconnectReason::DeviceDisconnected: return "device disconnected";
    case DisconnectReason::PayloadErrors:      return "too many malformed payloads";
    case DisconnectReason::Cancelled:          return "cancelled";
    }
    return "?";
}

const char* to_string(FailReason r) {
    switch (r) {
    case FailReason::ScanTimeout:  return "scan timeout";
    case FailReason::ConnectError: return "connect error";
    case FailReason::Cancelled:    return "cancelled";
    }
    return "?";
}

ConnectionSession::ConnectionSession(const AppConfig& cfg,
                                     BleAdapter& ble,
                                     OscEmitter& emitter,
                                     const ValueNormalizer& normalizer,
                                     const StopSignal& stop,
                                     std::optional<std::string> pinnedAddress)
    : cfg_(cfg),
      ble_(ble),
      emitter_(emitter),
      normalizer_(normalizer),
      stop_(stop),
      pinnedAddress_(std::move(pinnedAddress)),
      state_(Idle{}) {}

void ConnectionSession::transitionTo(ConnectionState next) {
    if (!isLegalTransition(state_, next)) {
        throw std::logic_error(std::string("illegal session transition ") +
                               stateName(state_) + " -> " + stateName(next));
    }
    std::cout << "[session] " << stateName(state_) << " -> " << describe(next) << "\n";
    state_ = std::move(next);
}

std::string ConnectionSession::scanPattern() const {
    if (pinnedAddress_) return "^" + regexEscape(*pinnedAddress_) + "$";
    return cfg_.ble.target_pattern;
}

SessionOutcome ConnectionSession::run() {
    if (!std::holds_alternative<Idle>(state_)) {
        throw std::logic_error("ConnectionSession::run called twice");
    }

    transitionTo(Scanning{});
    std::optional<DeviceHandle> found;
    try {
        found = ble_.scan(scanPattern(), std::chrono::milliseconds(cfg_.ble.scan_timeout_ms), stop_);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        transitionTo(Failed{stop_.stopRequested() ? FailReason::Cancelled : FailReason::ConnectError,
                            e.what()});
        return outcome();
    }

    if (!found) {
        if (stop_.stopRequested()) {
            transitionTo(Failed{FailReason::Cancelled, "stop requested while scanning"});
        } else {
            transitionTo(Failed{FailReason::ScanTimeout,
                                "no heart rate sensor matching '" + scanPattern() + "' within " +
                                    std::to_string(cfg_.ble.scan_timeout_ms) + " ms"});
        }
        return outcome();
    }

    device_ = *found;
    transitionTo(Connecting{*found});
    connectAndStream(*found);
    return outcome();
}

void ConnectionSession::connectAndStream(const DeviceHandle& device) {
    GattLinkGuard guard(ble_);
    std::unique_ptr<NotificationStream> stream;

    try {
        guard.adopt(ble_.connect(device, stop_));
        if (stop_.stopRequested()) {
            transitionTo(Failed{FailReason::Cancelled, "stop requested while connecting"});
            return;
        }
        stream = ble_.subscribe(guard.link(), kHeartRateMeasurementUuid);
    } catch (const std::exception& e) {
        if (stop_.stopRequested()) {
            transitionTo(Failed{FailReason::Cancelled, e.what()});
        } else {
            transitionTo(Failed{FailReason::ConnectError, e.what()});
        }
        return;
    }

    transitionTo(Subscribed{device});
    reachedSubscribed_ = true;

    try {
        receiveLoop(*stream);
    } catch (const std::logic_error&) {
        throw;
    } catch (const std::exception& e) {
        transitionTo(Disconnected{DisconnectReason::StreamEnded, e.what()});
    }

    // stream first, then the link it lives on
    stream.reset();
    guard.release();
}

void ConnectionSession::receiveLoop(NotificationStream& stream) {
    std::vector<uint8_t> frame;
    while (true) {
        if (stop_.stopRequested()) {
            transitionTo(Disconnected{DisconnectReason::Cancelled, "stop requested"});
            return;
        }

        switch (stream.next(frame, kNotificationPoll)) {
        case NotificationStream::Status::Timeout:
            break;

        case NotificationStream::Status::Ended:
            if (stream.endReason() == NotificationStream::EndReason::DeviceDisconnected) {
                transitionTo(Disconnected{DisconnectReason::DeviceDisconnected, ""});
            } else {
                transitionTo(Disconnected{DisconnectReason::StreamEnded, ""});
            }
            return;

        case NotificationStream::Status::Frame:
            // nothing goes out after cancellation
            if (stop_.stopRequested()) {
                transitionTo(Disconnected{DisconnectReason::Cancelled, "stop requested"});
                return;
            }
            if (!handleFrame(frame)) {
                transitionTo(Disconnected{DisconnectReason::PayloadErrors,
                                          std::to_string(consecutiveMalformed_) +
                                              " consecutive malformed payloads"});
                return;
            }
            break;
        }
    }
}

bool ConnectionSession::handleFrame(const std::vector<uint8_t>& frame) {
    SensorReading reading;
    try {
        reading = decodeHeartRate(frame, std::chrono::steady_clock::now());
    } catch (const MalformedPayload& e) {
        ++stats_.malformed;
        ++consecutiveMalformed_;
        std::cerr << "[session] skipped malformed payload (" << consecutiveMalformed_ << "/"
                  << cfg_.ble.malformed_tolerance << "): " << e.what() << "\n";
        return consecutiveMalformed_ <= cfg_.ble.malformed_tolerance;
    }
    consecutiveMalformed_ = 0;

    const NormalizedValue nv = normalizer_.normalize(reading.heartRateBpm);
    if (nv.clampedLow) ++stats_.clampedLow;
    if (nv.clampedHigh) ++stats_.clampedHigh;

    std::cout << "[session] hr=" << reading.heartRateBpm << " bpm -> " << nv.value
              << (nv.clampedLow ? " (clamped low)" : "")
              << (nv.clampedHigh ? " (clamped high)" : "");
    if (reading.sensorContact && !*reading.sensorContact) std::cout << " (no skin contact)";
    std::cout << "\n";

    try {
        emitter_.publish(cfg_.osc.bpm_parameter, static_cast<int32_t>(reading.heartRateBpm));
    } catch (const TransportUnavailable& e) {
        ++stats_.publishFailures;
        std::cerr << "[session] publish " << cfg_.osc.bpm_parameter << " failed: " << e.what() << "\n";
    }
    try {
        emitter_.publish(cfg_.osc.normalized_parameter, nv.value);
    } catch (const TransportUnavailable& e) {
        ++stats_.publishFailures;
        std::cerr << "[session] publish " << cfg_.osc.normalized_parameter << " failed: " << e.what() << "\n";
    }

    ++stats_.readings;
    return true;
}

SessionOutcome ConnectionSession::outcome() const {
    SessionOutcome out;
    out.terminal = state_;
    out.reachedSubscribed = reachedSubscribed_;
    out.device = device_;
    out.stats = stats_;
    return out;
}
