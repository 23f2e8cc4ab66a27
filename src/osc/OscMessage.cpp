#include "osc/OscMessage.hpp"
#include "osc/LoMessage.hpp"
#include <new>
#include <stdexcept>

LoMessage::LoMessage(const OscMessage& msg) : msg_(lo_message_new()) {
    if (!msg_) throw std::bad_alloc();
    for (const auto& a : msg.args()) {
        int rc = 0;
        if (const auto* i = std::get_if<int32_t>(&a)) {
            rc = lo_message_add_int32(msg_, *i);
        } else if (const auto* f = std::get_if<float>(&a)) {
            rc = lo_message_add_float(msg_, *f);
        } else {
            rc = lo_message_add_string(msg_, std::get<std::string>(a).c_str());
        }
        if (rc != 0) {
            lo_message_free(msg_);
            throw std::runtime_error("cannot add argument to OSC message " + msg.address());
        }
    }
}

LoMessage::~LoMessage() {
    lo_message_free(msg_);
}

OscMessage::OscMessage(std::string address) : address_(std::move(address)) {}

OscMessage& OscMessage::add(int32_t v) {
    args_.emplace_back(std::in_place_type<int32_t>, v);
    return *this;
}

OscMessage& OscMessage::add(float v) {
    args_.emplace_back(std::in_place_type<float>, v);
    return *this;
}

OscMessage& OscMessage::add(std::string v) {
    args_.emplace_back(std::in_place_type<std::string>, std::move(v));
    return *this;
}

std::string OscMessage::typeTags() const {
    std::string tags = ",";
    for (const auto& a : args_) {
        if (std::holds_alternative<int32_t>(a))      tags.push_back('i');
        else if (std::holds_alternative<float>(a))   tags.push_back('f');
        else                                         tags.push_back('s');
    }
    return tags;
}

std::vector<uint8_t> OscMessage::encode() const {
    LoMessage lo(*this);
    size_t size = lo_message_length(lo.get(), address_.c_str());
    std::vector<uint8_t> out(size);
    if (!lo_message_serialise(lo.get(), address_.c_str(), out.data(), &size)) {
        throw std::runtime_error("cannot serialise OSC message " + address_);
    }
    out.resize(size);
    return out;
}
