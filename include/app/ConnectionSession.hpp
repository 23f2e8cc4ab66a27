#pragma once
#include "app/Config.hpp"
#include "ble/BleAdapter.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

class OscEmitter;
class ValueNormalizer;
class StopSignal;

namespace session {

enum class DisconnectReason { StreamEnded, DeviceDisconnected, PayloadErrors, Cancelled };
enum class FailReason { ScanTimeout, ConnectError, Cancelled };

struct Idle {};
struct Scanning {};
struct Connecting { DeviceHandle device; };
struct Subscribed { DeviceHandle device; };
struct Disconnected { DisconnectReason reason; std::string detail; };
struct Failed { FailReason reason; std::string detail; };

} // namespace session

// Idle -> Scanning -> Connecting -> Subscribed -> Disconnected, with Failed
// reachable from Scanning and Connecting. Disconnected and Failed are terminal.
using ConnectionState = std::variant<session::Idle,
                                     session::Scanning,
                                     session::Connecting,
                                     session::Subscribed,
                                     session::Disconnected,
                                     session::Failed>;

const char* stateName(const ConnectionState& s);
std::string describe(const ConnectionState& s);
bool isTerminal(const ConnectionState& s);
bool isLegalTransition(const ConnectionState& from, const ConnectionState& to);

const char* to_string(session::DisconnectReason r);
const char* to_string(session::FailReason r);

struct SessionStats {
    uint64_t readings = 0;          // decoded and handed to the emitter
    uint64_t malformed = 0;
    uint64_t publishFailures = 0;
    uint64_t clampedLow = 0;
    uint64_t clampedHigh = 0;
};

struct SessionOutcome {
    ConnectionState terminal;
    bool reachedSubscribed = false;
    std::optional<DeviceHandle> device;
    SessionStats stats;
};

// One scan/connect/subscribe attempt, then forwards notifications until the
// subscription ends. Never retries. The link is released before run() returns.
class ConnectionSession {
public:
    ConnectionSession(const AppConfig& cfg,
                      BleAdapter& ble,
                      OscEmitter& emitter,
                      const ValueNormalizer& normalizer,
                      const StopSignal& stop,
                      std::optional<std::string> pinnedAddress = std::nullopt);

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    // Blocks until a terminal state is reached. May only be called once.
    SessionOutcome run();

    const ConnectionState& state() const { return state_; }

private:
    void transitionTo(ConnectionState next);
    void connectAndStream(const DeviceHandle& device);
    void receiveLoop(NotificationStream& stream);
    // false once the malformed payload tolerance is exceeded
    bool handleFrame(const std::vector<uint8_t>& frame);
    std::string scanPattern() const;
    SessionOutcome outcome() const;

    const AppConfig& cfg_;
    BleAdapter& ble_;
    OscEmitter& emitter_;
    const ValueNormalizer& normalizer_;
    const StopSignal& stop_;
    std::optional<std::string> pinnedAddress_;

    ConnectionState state_;
    std::optional<DeviceHandle> device_;
    bool reachedSubscribed_ = false;
    int consecutiveMalformed_ = 0;
    SessionStats stats_;
};
