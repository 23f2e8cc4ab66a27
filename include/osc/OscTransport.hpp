#pragma once
#include "osc/OscMessage.hpp"
#include <map>
#include <memory>
#include <string>

// "Send message to address" capability. Fire-and-forget; throws
// TransportUnavailable when the packet cannot be handed to the network.
class OscTransport {
public:
    virtual ~OscTransport() = default;
    virtual void send(const std::string& host, int port, const OscMessage& msg) = 0;
};

// UDP sender on liblo. One lo_address per destination, kept for reuse.
class UdpOscTransport : public OscTransport {
public:
    UdpOscTransport();
    ~UdpOscTransport() override;

    UdpOscTransport(const UdpOscTransport&) = delete;
    UdpOscTransport& operator=(const UdpOscTransport&) = delete;

    void send(const std::string& host, int port, const OscMessage& msg) override;

private:
    struct Destinations;
    std::unique_ptr<Destinations> destinations_;
};
