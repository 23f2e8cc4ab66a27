#include "osc/OscEmitter.hpp"
#include "app/Errors.hpp"

static constexpr const char* kDefaultTemplate = "{prefix}{name}";

static void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string expandAddressTemplate(const std::string& tmpl,
                                  const std::string& prefix,
                                  const std::string& name) {
    std::string out = tmpl;
    replaceAll(out, "{prefix}", prefix);
    replaceAll(out, "{name}", name);
    return out;
}

OscEmitter::OscEmitter(const OscConfig& cfg, OscTransport& transport)
    : cfg_(cfg), transport_(transport) {
    auto check = [this](const std::string& name) {
        const std::string addr = addressFor(name);
        if (addr.empty() || addr[0] != '/' || addr.find(' ') != std::string::npos) {
            throw ConfigurationError("invalid OSC address '" + addr + "' for parameter '" + name + "'");
        }
    };
    check(cfg_.bpm_parameter);
    check(cfg_.normalized_parameter);
    for (const auto& [name, tmpl] : cfg_.address_templates) {
        (void)tmpl;
        check(name);
    }
}

std::string OscEmitter::addressFor(const std::string& parameterName) const {
    auto it = cfg_.address_templates.find(parameterName);
    const std::string& tmpl = it != cfg_.address_templates.end() ? it->second
                                                                 : std::string(kDefaultTemplate);
    return expandAddressTemplate(tmpl, cfg_.address_prefix, parameterName);
}

void OscEmitter::publish(const std::string& parameterName, int32_t value) {
    OscMessage msg(addressFor(parameterName));
    msg.add(value);
    send(msg);
}

void OscEmitter::publish(const std::string& parameterName, float value) {
    OscMessage msg(addressFor(parameterName));
    msg.add(value);
    send(msg);
}

void OscEmitter::send(const OscMessage& msg) {
    try {
        transport_.send(cfg_.host, cfg_.port, msg);
    } catch (const TransportUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw TransportUnavailable(std::string("OSC send to ") + msg.address() + " failed: " + e.what());
    }
}
