#pragma once
#include "app/Backoff.hpp"
#include "app/Config.hpp"
#include "app/StopSignal.hpp"
#include "hr/ValueNormalizer.hpp"
#include "osc/OscEmitter.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <thread>

class BleAdapter;
struct SessionOutcome;

// Runs one ConnectionSession at a time with backoff in between. Pins the last
// found address until ble.max_connect_retries sessions fail on it.
class BridgeSupervisor {
public:
    // Throws ConfigurationError (normalizer range, OSC address templates).
    BridgeSupervisor(const AppConfig& cfg, BleAdapter& ble, OscTransport& transport, StopSignal& stop);
    ~BridgeSupervisor();

    // lifecycle
    void start();  // run() on a worker thread
    void stop();   // signal cancellation and join
    void wait();   // block until the worker exits

    // Runs the loop on the calling thread until stop is requested.
    // ConfigurationError propagates; everything else is retried.
    void run();

    // The worker died on a configuration error.
    bool fatal() const { return fatal_.load(); }

private:
    void afterSession(const SessionOutcome& outcome);

    const AppConfig& cfg_;
    BleAdapter& ble_;
    StopSignal& stop_;

    ValueNormalizer normalizer_;
    OscEmitter emitter_;
    Backoff backoff_;

    std::optional<std::string> pinnedAddress_;
    int pinnedFailures_ = 0;
    unsigned sessionCount_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> fatal_{false};
    std::thread loop_thread_;
};
