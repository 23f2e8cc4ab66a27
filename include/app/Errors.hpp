#pragma once
#include <stdexcept>
#include <string>

// Base for everything the bridge throws on purpose.
class BridgeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Notification payload shorter than its own flags imply.
class MalformedPayload : public BridgeError {
public:
    using BridgeError::BridgeError;
};

// BLE connect / service discovery / subscribe failure. Session-fatal.
class ConnectError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

// OSC packet could not be handed to the network. Per-publish, never retried.
class TransportUnavailable : public BridgeError {
public:
    using BridgeError::BridgeError;
};

// Invalid configuration. Process-fatal at startup.
class ConfigurationError : public BridgeError {
public:
    using BridgeError::BridgeError;
};
