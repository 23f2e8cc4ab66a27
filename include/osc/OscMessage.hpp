#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using OscArgument = std::variant<int32_t, float, std::string>;

// One OSC message: address pattern plus typed arguments.
class OscMessage {
public:
    explicit OscMessage(std::string address);

    OscMessage& add(int32_t v);
    OscMessage& add(float v);
    OscMessage& add(std::string v);

    const std::string& address() const { return address_; }
    const std::vector<OscArgument>& args() const { return args_; }

    // ",i", ",f", ",s" ... one tag per argument
    std::string typeTags() const;

    // Wire form as liblo serialises it.
    std::vector<uint8_t> encode() const;

private:
    std::string address_;
    std::vector<OscArgument> args_;
};
