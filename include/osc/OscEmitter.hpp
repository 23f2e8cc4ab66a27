#pragma once
#include "app/Config.hpp"
#include "osc/OscTransport.hpp"
#include <cstdint>
#include <map>
#include <string>

class OscEmitter {
public:
    // Throws ConfigurationError if a configured template resolves to an invalid address.
    OscEmitter(const OscConfig& cfg, OscTransport& transport);

    // 'i' and 'f' respectively. Throws TransportUnavailable; nothing is queued.
    void publish(const std::string& parameterName, int32_t value);
    void publish(const std::string& parameterName, float value);

    std::string addressFor(const std::string& parameterName) const;

private:
    void send(const OscMessage& msg);

    OscConfig cfg_;
    OscTransport& transport_;
};

// Replaces every {prefix} and {name} in tmpl.
std::string expandAddressTemplate(const std::string& tmpl,
                                  const std::string& prefix,
                                  const std::string& name);
