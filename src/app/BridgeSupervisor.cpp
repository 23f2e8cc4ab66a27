#include "app/BridgeSupervisor.hpp"
#include "app/ConnectionSession.hpp"
#include "app/Errors.hpp"
#include <iostream>

BridgeSupervisor::BridgeSupervisor(const AppConfig& cfg,
                                   BleAdapter& ble,
                                   OscTransport& transport,
                                   StopSignal& stop)
    : cfg_(cfg),
      ble_(ble),
      stop_(stop),
      normalizer_(cfg.normalize),
      emitter_(cfg.osc, transport),
      backoff_(cfg.backoff) {}

BridgeSupervisor::~BridgeSupervisor() {
    stop();
}

void BridgeSupervisor::start() {
    if (running_.exchange(true)) return;
    loop_thread_ = std::thread([this] {
        try {
            run();
        } catch (const ConfigurationError& e) {
            std::cerr << "[supervisor] fatal: " << e.what() << "\n";
            fatal_ = true;
            stop_.requestStop();
        }
    });
    std::cout << "[supervisor] Started.\n";
}

void BridgeSupervisor::stop() {
    stop_.requestStop();
    if (!running_.exchange(false)) return;
    if (loop_thread_.joinable()) loop_thread_.join();
    std::cout << "[supervisor] Stopped.\n";
}

void BridgeSupervisor::wait() {
    if (loop_thread_.joinable()) loop_thread_.join();
}

void BridgeSupervisor::run() {
    std::cout << "[supervisor] OSC target " << cfg_.osc.host << ":" << cfg_.osc.port
              << " " << emitter_.addressFor(cfg_.osc.bpm_parameter)
              << ", " << emitter_.addressFor(cfg_.osc.normalized_parameter)
              << " (" << to_string(cfg_.normalize.mode) << ")\n";

    while (!stop_.stopRequested()) {
        ++sessionCount_;
        std::cout << "[supervisor] session #" << sessionCount_
                  << (pinnedAddress_ ? " pinned to " + *pinnedAddress_ : std::string(" scanning"))
                  << "\n";

        try {
            ConnectionSession session(cfg_, ble_, emitter_, normalizer_, stop_, pinnedAddress_);
            afterSession(session.run());
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[supervisor] session aborted: " << e.what() << "\n";
        }

        if (stop_.stopRequested()) break;

        const auto delay = backoff_.nextDelay();
        std::cout << "[supervisor] retrying in " << delay.count() << " ms (attempt "
                  << backoff_.attempt() << ")\n";
        if (stop_.waitFor(delay)) break;
    }

    std::cout << "[supervisor] loop finished after " << sessionCount_ << " session(s)\n";
}

void BridgeSupervisor::afterSession(const SessionOutcome& outcome) {
    std::cout << "[supervisor] session ended: " << describe(outcome.terminal)
              << " readings=" << outcome.stats.readings
              << " malformed=" << outcome.stats.malformed
              << " publish_failures=" << outcome.stats.publishFailures << "\n";

    if (outcome.reachedSubscribed) {
        backoff_.reset();
        pinnedFailures_ = 0;
        pinnedAddress_ = outcome.device->address;
        return;
    }

    if (!pinnedAddress_ && outcome.device) {
        // found but never subscribed: keep trying this one
        pinnedAddress_ = outcome.device->address;
        pinnedFailures_ = 0;
    }
    if (pinnedAddress_ && ++pinnedFailures_ >= cfg_.ble.max_connect_retries) {
        std::cout << "[supervisor] " << pinnedFailures_ << " failed attempts on "
                  << *pinnedAddress_ << "; rescanning\n";
        pinnedAddress_.reset();
        pinnedFailures_ = 0;
    }
}
