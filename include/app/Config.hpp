#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace YAML { class Node; } // fwd decl

// Keep config structs simple & POD-like; loaded once, read-only afterwards.
struct BleConfig {
    std::string adapter = "hci0";
    std::string target_pattern;      // regex on name or address, empty = any HR sensor

    int scan_timeout_ms = 10000;
    int connect_timeout_ms = 20000;
    int malformed_tolerance = 2;     // consecutive bad payloads skipped before giving up
    int max_connect_retries = 5;     // failed pinned sessions before rescanning
};

struct OscConfig {
    std::string host = "127.0.0.1";
    int port = 9000;
    std::string address_prefix = "/avatar/parameters/";
    std::string bpm_parameter = "heartbeat_value";
    std::string normalized_parameter = "heartbeat_waittime";
    // parameter name -> template using {prefix} and {name}
    std::map<std::string, std::string> address_templates;
};

enum class NormalizeMode { Linear, WaitTime };

struct NormalizeConfig {
    NormalizeMode mode = NormalizeMode::Linear;
    double min_bpm = 40.0;
    double max_bpm = 180.0;
    // wait_time mode: value = hr_const / (60 / bpm - hr_flex)
    double hr_const = 0.2;
    double hr_flex = 0.2;
};

enum class BackoffKind { Fixed, Exponential };

struct BackoffConfig {
    BackoffKind kind = BackoffKind::Exponential;
    std::chrono::milliseconds initial{3000};
    double multiplier = 2.0;
    std::chrono::milliseconds max{30000};
};

struct AppConfig {
    BleConfig ble;
    OscConfig osc;
    NormalizeConfig normalize;
    BackoffConfig backoff;
};

// All three throw ConfigurationError on parse or validation errors.
AppConfig load_config_from_file(const std::string& path);
AppConfig load_config_from_node(const YAML::Node& root);
void validate_config(const AppConfig& cfg);

const char* to_string(NormalizeMode mode);
const char* to_string(BackoffKind kind);
