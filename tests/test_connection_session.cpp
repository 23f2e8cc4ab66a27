#include "app/ConnectionSession.hpp"
#include "hr/ValueNormalizer.hpp"
#include "osc/OscEmitter.hpp"
#include "fakes.hpp"
#include <cassert>
#include <iostream>

/**
 * ConnectionSession tests, driven by a scripted BLE adapter:
 * 1. Happy path publishes bpm then normalized value, in order
 * 2. Scan timeout, adapter unavailable, connect/subscribe failures
 * 3. Device loss and stream end
 * 4. Malformed payload tolerance
 * 5. Publish failures do not end the session
 * 6. Cancellation while scanning, connecting and subscribed
 * 7. Pinned address and transition table
 */

using namespace session;

struct Rig {
    AppConfig cfg;
    FakeBleAdapter ble;
    RecordingTransport transport;
    StopSignal stop;

    SessionOutcome run(std::optional<std::string> pinned = std::nullopt) {
        ble.stopSignal = &stop;
        ValueNormalizer normalizer(cfg.normalize);
        OscEmitter emitter(cfg.osc, transport);
        ConnectionSession s(cfg, ble, emitter, normalizer, stop, std::move(pinned));
        assert(std::holds_alternative<Idle>(s.state()));
        SessionOutcome out = s.run();
        assert(isTerminal(s.state()));
        return out;
    }
};

int main() {
    std::cout << "Testing ConnectionSession..." << std::endl;

    // Test 1: happy path
    {
        std::cout << "Test 1: readings are published in order" << std::endl;

        Rig rig;
        rig.ble.scripts[0].events = {
            StreamEvent::frame({0x00, 0x4B}),
            StreamEvent::frame({0x06, 0x6E}),
            StreamEvent::end(),
        };
        const SessionOutcome out = rig.run();

        assert(out.reachedSubscribed);
        assert(out.device && out.device->address == "AA:BB:CC:DD:EE:FF");
        const auto* d = std::get_if<Disconnected>(&out.terminal);
        assert(d && d->reason == DisconnectReason::StreamEnded);
        assert(out.stats.readings == 2);

        const auto& sent = rig.transport.sent;
        assert(sent.size() == 4);
        assert(sent[0].msg.address() == "/avatar/parameters/heartbeat_value");
        assert(std::get<int32_t>(sent[0].msg.args()[0]) == 75);
        assert(sent[1].msg.address() == "/avatar/parameters/heartbeat_waittime");
        assert(near(std::get<float>(sent[1].msg.args()[0]), 0.25));
        assert(std::get<int32_t>(sent[2].msg.args()[0]) == 110);
        assert(near(std::get<float>(sent[3].msg.args()[0]), 0.5));
        assert(sent[0].host == "127.0.0.1" && sent[0].port == 9000);

        assert(rig.ble.subscribeCalls == 1);
        assert(rig.ble.disconnectCalls == 1);
        assert(rig.ble.openLinks == 0 && rig.ble.openStreams == 0);
        assert(rig.ble.streamClosedBeforeLink);
        assert(rig.ble.scanPatterns[0].empty());

        std::cout << "  happy path test passed" << std::endl;
    }

    // Test 2: failures before subscription
    {
        std::cout << "Test 2: scan and connect failures" << std::endl;

        Rig noDevice;
        noDevice.ble.scripts[0].deviceFound = false;
        SessionOutcome out = noDevice.run();
        auto* f = std::get_if<Failed>(&out.terminal);
        assert(f && f->reason == FailReason::ScanTimeout);
        assert(!out.reachedSubscribed && !out.device);
        assert(noDevice.ble.connectCalls == 0);
        assert(noDevice.transport.attempts == 0);

        Rig connectFails;
        connectFails.ble.scripts[0].connectFails = true;
        out = connectFails.run();
        f = std::get_if<Failed>(&out.terminal);
        assert(f && f->reason == FailReason::ConnectError);
        assert(f->detail.find("abort") != std::string::npos);
        assert(out.device.has_value());
        assert(connectFails.ble.disconnectCalls == 0);

        // adapter missing: a session failure, not an exception
        Rig noAdapter;
        noAdapter.ble.scripts[0].adapterUnavailable = true;
        out = noAdapter.run();
        f = std::get_if<Failed>(&out.terminal);
        assert(f && f->reason == FailReason::ConnectError);
        assert(f->detail.find("hci0") != std::string::npos);
        assert(noAdapter.ble.connectCalls == 0);
        assert(!out.device);

        // link acquired, subscribe fails: the link is still released
        Rig subscribeFails;
        subscribeFails.ble.scripts[0].subscribeFails = true;
        out = subscribeFails.run();
        f = std::get_if<Failed>(&out.terminal);
        assert(f && f->reason == FailReason::ConnectError);
        assert(subscribeFails.ble.disconnectCalls == 1);
        assert(subscribeFails.ble.openLinks == 0);

        std::cout << "  failure test passed" << std::endl;
    }

    // Test 3: device loss
    {
        std::cout << "Test 3: device disconnect" << std::endl;

        Rig rig;
        rig.ble.scripts[0].events = {StreamEvent::frame({0x00, 0x50}), StreamEvent::deviceLost()};
        const SessionOutcome out = rig.run();
        const auto* d = std::get_if<Disconnected>(&out.terminal);
        assert(d && d->reason == DisconnectReason::DeviceDisconnected);
        assert(out.stats.readings == 1);
        assert(rig.ble.openLinks == 0);

        std::cout << "  device disconnect test passed" << std::endl;
    }

    // Test 4: malformed payload tolerance
    {
        std::cout << "Test 4: malformed payloads" << std::endl;

        // default tolerance 2: two bad frames in a row are skipped
        Rig tolerated;
        tolerated.ble.scripts[0].events = {
            StreamEvent::frame({0x01, 0x4B}),
            StreamEvent::frame({0x00, 0x48}),
            StreamEvent::frame({}),
            StreamEvent::frame({0x01}),
            StreamEvent::frame({0x00, 0x49}),
        };
        SessionOutcome out = tolerated.run();
        auto* d = std::get_if<Disconnected>(&out.terminal);
        assert(d && d->reason == DisconnectReason::StreamEnded);
        assert(out.stats.malformed == 3);
        assert(out.stats.readings == 2);
        // nothing partial went out for the bad frames
        assert(tolerated.transport.sent.size() == 4);

        // a burst beyond the tolerance ends the session
        Rig burst;
        burst.ble.scripts[0].events = {
            StreamEvent::frame({0x00, 0x48}),
            StreamEvent::frame({0x01}),
            StreamEvent::frame({0x01}),
            StreamEvent::frame({0x01}),
            StreamEvent::frame({0x00, 0x49}),
        };
        out = burst.run();
        d = std::get_if<Disconnected>(&out.terminal);
        assert(d && d->reason == DisconnectReason::PayloadErrors);
        assert(out.stats.readings == 1);
        assert(out.stats.malformed == 3);
        assert(burst.transport.sent.size() == 2);
        assert(burst.ble.openLinks == 0);

        // a stray byte after an empty RR list is still a good reading
        Rig strayByte;
        strayByte.ble.scripts[0].events = {
            StreamEvent::frame({0x10, 0x48, 0x00}),
            StreamEvent::frame({0x10, 0x48, 0x00}),
            StreamEvent::frame({0x10, 0x48, 0x00}),
        };
        out = strayByte.run();
        d = std::get_if<Disconnected>(&out.terminal);
        assert(d && d->reason == DisconnectReason::StreamEnded);
        assert(out.stats.readings == 3 && out.stats.malformed == 0);
        assert(strayByte.transport.sent.size() == 6);
        assert(std::get<int32_t>(strayByte.transport.sent[0].msg.args()[0]) == 72);

        // zero tolerance
        Rig strict;
        strict.cfg.ble.malformed_tolerance = 0;
        strict.ble.scripts[0].events = {StreamEvent::frame({0x08, 0x48})};
        out = strict.run();
        d = std::get_if<Disconnected>(&out.terminal);
        assert(d && d->reason == DisconnectReason::PayloadErrors);

        std::cout << "  malformed payload test passed" << std::endl;
    }

    // Test 5: transport failures
    {
        std::cout << "Test 5: publish failures" << std::endl;

        Rig rig;
        rig.transport.failNext = 2;     // both messages of the first reading
        rig.ble.scripts[0].events = {StreamEvent::frame({0x00, 0x4B}), StreamEvent::frame({0x00, 0xB4})};
        const SessionOutcome out = rig.run();
        assert(out.stats.publishFailures == 2);
        assert(out.stats.readings == 2);
        assert(rig.transport.sent.size() == 2);
        assert(std::get<int32_t>(rig.transport.sent[0].msg.args()[0]) == 180);
        assert(near(std::get<float>(rig.transport.sent[1].msg.args()[0]), 1.0));
        assert(std::holds_alternative<Disconnected>(out.terminal));

        std::cout << "  publish failure test passed" << std::endl;
    }

    // Test 6: cancellation
    {
        std::cout << "Test 6: cancellation" << std::endl;

        Rig rig;
        rig.ble.scripts[0].events = {
            StreamEvent::frame({0x00, 0x4B}),
            StreamEvent::stopThenFrame({0x00, 0x4C}),
            StreamEvent::frame({0x00, 0x4D}),
        };
        const SessionOutcome out = rig.run();
        const auto* d = std::get_if<Disconnected>(&out.terminal);
        assert(d && d->reason == DisconnectReason::Cancelled);
        assert(out.stats.readings == 1);
        assert(rig.transport.sent.size() == 2);
        assert(rig.ble.disconnectCalls == 1);
        assert(rig.ble.openLinks == 0 && rig.ble.openStreams == 0);

        // cancelled during scan
        Rig scanning;
        scanning.stop.requestStop();
        scanning.ble.scripts[0].deviceFound = false;
        const SessionOutcome out2 = scanning.run();
        const auto* f = std::get_if<Failed>(&out2.terminal);
        assert(f && f->reason == FailReason::Cancelled);

        // cancelled while Connect is pending: link released, nothing published
        Rig connecting;
        connecting.ble.scripts[0].stopDuringConnect = true;
        connecting.ble.scripts[0].events = {StreamEvent::frame({0x00, 0x4B})};
        const SessionOutcome out3 = connecting.run();
        f = std::get_if<Failed>(&out3.terminal);
        assert(f && f->reason == FailReason::Cancelled);
        assert(!out3.reachedSubscribed);
        assert(connecting.ble.connectCalls == 1);
        assert(connecting.ble.subscribeCalls == 0);
        assert(connecting.ble.disconnectCalls == 1);
        assert(connecting.ble.openLinks == 0);
        assert(connecting.transport.attempts == 0);

        std::cout << "  cancellation test passed" << std::endl;
    }

    // Test 7: pinning, clamp stats and the transition table
    {
        std::cout << "Test 7: pinned address and transitions" << std::endl;

        Rig rig;
        rig.cfg.ble.target_pattern = "polar";
        rig.ble.scripts[0].events = {StreamEvent::frame({0x00, 0x20}), StreamEvent::frame({0x00, 0xC8})};
        SessionOutcome out = rig.run("AA:BB:CC:DD:EE:FF");
        assert(rig.ble.scanPatterns[0] == "^AA:BB:CC:DD:EE:FF$");
        assert(out.stats.clampedLow == 1 && out.stats.clampedHigh == 1);

        Rig byPattern;
        byPattern.cfg.ble.target_pattern = "polar";
        byPattern.run();
        assert(byPattern.ble.scanPatterns[0] == "polar");

        const DeviceHandle dev{"11:22:33:44:55:66", "HRM", "/x"};
        assert(isLegalTransition(Idle{}, Scanning{}));
        assert(isLegalTransition(Scanning{}, Connecting{dev}));
        assert(isLegalTransition(Scanning{}, Failed{FailReason::ScanTimeout, ""}));
        assert(isLegalTransition(Connecting{dev}, Subscribed{dev}));
        assert(isLegalTransition(Subscribed{dev}, Disconnected{DisconnectReason::StreamEnded, ""}));
        assert(!isLegalTransition(Idle{}, Subscribed{dev}));
        assert(!isLegalTransition(Scanning{}, Subscribed{dev}));
        assert(!isLegalTransition(Subscribed{dev}, Failed{FailReason::ConnectError, ""}));
        assert(!isLegalTransition(Disconnected{DisconnectReason::Cancelled, ""}, Scanning{}));
        assert(!isLegalTransition(Failed{FailReason::ScanTimeout, ""}, Idle{}));
        assert(std::string(stateName(Subscribed{dev})) == "Subscribed");
        assert(describe(Failed{FailReason::ScanTimeout, "10 s"}) == "Failed(scan timeout: 10 s)");

        std::cout << "  pinned address and transition test passed" << std::endl;
    }

    std::cout << "All ConnectionSession tests passed!" << std::endl;
    return 0;
}
