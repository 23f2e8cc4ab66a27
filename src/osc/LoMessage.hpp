#pragma once
#include "osc/OscMessage.hpp"
#include <lo/lo.h>

// Owning wrapper around a liblo message built from an OscMessage.
class LoMessage {
public:
    explicit LoMessage(const OscMessage& msg);
    ~LoMessage();

    LoMessage(const LoMessage&) = delete;
    LoMessage& operator=(const LoMessage&) = delete;

    lo_message get() const { return msg_; }

private:
    lo_message msg_;
};
