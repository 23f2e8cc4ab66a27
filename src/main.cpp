#include "app/BridgeSupervisor.hpp"
#include "app/Config.hpp"
#include "app/Errors.hpp"
#include "ble/BlueZAdapter.hpp"
#include "osc/OscTransport.hpp"
#include <csignal>
#include <memory>
#include <atomic>
#include <iostream>
#include <thread>
#include <chrono>

static std::atomic<bool> g_sigint{false};

static void handle_signal(int) {
    g_sigint.store(true);
}

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config.yaml";

    AppConfig cfg;
    try {
        cfg = load_config_from_file(configPath);
    } catch (const ConfigurationError& e) {
        std::cerr << "[fatal] config: " << e.what() << "\n";
        return 2;
    }

    BlueZAdapter ble(cfg.ble.adapter, std::chrono::milliseconds(cfg.ble.connect_timeout_ms));
    try {
        ble.init();
    } catch (const ConnectError& e) {
        // bluetoothd may come up later; each session checks again
        std::cerr << "[main] bluetooth not ready: " << e.what() << "\n";
    }

    UdpOscTransport transport;
    StopSignal stop;

    std::unique_ptr<BridgeSupervisor> supervisor;
    try {
        supervisor = std::make_unique<BridgeSupervisor>(cfg, ble, transport, stop);
    } catch (const ConfigurationError& e) {
        std::cerr << "[fatal] config: " << e.what() << "\n";
        return 2;
    }

    // Signals
    std::signal(SIGINT,  handle_signal);
    std::signal(SIGTERM, handle_signal);

    supervisor->start();

    // Run until Ctrl+C (or systemd stop)
    while (!g_sigint.load() && !stop.stopRequested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (g_sigint.load()) std::cout << "[main] signal received; stopping…\n";
    supervisor->stop();
    return supervisor->fatal() ? 2 : 0;
}
