#include "osc/OscTransport.hpp"
#include "osc/LoMessage.hpp"
#include "app/Errors.hpp"

struct UdpOscTransport::Destinations {
    std::map<std::string, lo_address> byKey;

    ~Destinations() {
        for (auto& [key, addr] : byKey) lo_address_free(addr);
    }

    lo_address get(const std::string& host, int port) {
        const std::string key = host + ":" + std::to_string(port);
        auto it = byKey.find(key);
        if (it != byKey.end()) return it->second;

        lo_address addr = lo_address_new_with_proto(LO_UDP, host.c_str(), std::to_string(port).c_str());
        if (!addr) throw TransportUnavailable("cannot create OSC address " + key);
        return byKey.emplace(key, addr).first->second;
    }
};

UdpOscTransport::UdpOscTransport() : destinations_(std::make_unique<Destinations>()) {}

UdpOscTransport::~UdpOscTransport() = default;

void UdpOscTransport::send(const std::string& host, int port, const OscMessage& msg) {
    lo_address addr = destinations_->get(host, port);
    LoMessage lo(msg);

    if (lo_send_message(addr, msg.address().c_str(), lo.get()) < 0) {
        const char* err = lo_address_errstr(addr);
        const std::string why = err ? std::string(err) : "errno " + std::to_string(lo_address_errno(addr));
        throw TransportUnavailable("send " + host + ":" + std::to_string(port) + " failed: " + why);
    }
}
