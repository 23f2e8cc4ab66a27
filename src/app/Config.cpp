#include "app/Config.hpp"
#include "app/Errors.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <iostream>
#include <regex>

static BleConfig parse_ble(const YAML::Node& node) {
    BleConfig cfg;

    if (!node || !node.IsMap()) return cfg; // leave defaults

    if (auto v = node["adapter"])             cfg.adapter = v.as<std::string>();
    if (auto v = node["target_pattern"])      cfg.target_pattern = v.as<std::string>();

    if (auto v = node["scan_timeout_ms"])     cfg.scan_timeout_ms = v.as<int>();
    if (auto v = node["connect_timeout_ms"])  cfg.connect_timeout_ms = v.as<int>();
    if (auto v = node["malformed_tolerance"]) cfg.malformed_tolerance = v.as<int>();
    if (auto v = node["max_connect_retries"]) cfg.max_connect_retries = v.as<int>();

    return cfg;
}

static OscConfig parse_osc(const YAML::Node& node) {
    OscConfig cfg;

    if (!node || !node.IsMap()) return cfg;

    if (auto v = node["host"])                 cfg.host = v.as<std::string>();
    if (auto v = node["port"])                 cfg.port = v.as<int>();
    if (auto v = node["address_prefix"])       cfg.address_prefix = v.as<std::string>();
    if (auto v = node["bpm_parameter"])        cfg.bpm_parameter = v.as<std::string>();
    if (auto v = node["normalized_parameter"]) cfg.normalized_parameter = v.as<std::string>();

    if (auto t = node["address_templates"]) {
        if (!t.IsMap()) {
            throw ConfigurationError("osc.address_templates must be a map");
        }
        for (const auto& kv : t) {
            cfg.address_templates[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }

    return cfg;
}

static NormalizeConfig parse_normalize(const YAML::Node& node) {
    NormalizeConfig cfg;

    if (!node || !node.IsMap()) return cfg;

    if (auto v = node["mode"]) {
        const std::string mode = v.as<std::string>();
        if (mode == "linear")         cfg.mode = NormalizeMode::Linear;
        else if (mode == "wait_time") cfg.mode = NormalizeMode::WaitTime;
        else throw ConfigurationError("normalize.mode: unknown mode '" + mode + "'");
    }
    if (auto v = node["min_bpm"])  cfg.min_bpm = v.as<double>();
    if (auto v = node["max_bpm"])  cfg.max_bpm = v.as<double>();
    if (auto v = node["hr_const"]) cfg.hr_const = v.as<double>();
    if (auto v = node["hr_flex"])  cfg.hr_flex = v.as<double>();

    return cfg;
}

static BackoffConfig parse_backoff(const YAML::Node& node) {
    BackoffConfig cfg;

    if (!node || !node.IsMap()) return cfg;

    if (auto v = node["kind"]) {
        const std::string kind = v.as<std::string>();
        if (kind == "fixed")            cfg.kind = BackoffKind::Fixed;
        else if (kind == "exponential") cfg.kind = BackoffKind::Exponential;
        else throw ConfigurationError("backoff.kind: unknown kind '" + kind + "'");
    }
    if (auto v = node["initial_ms"]) cfg.initial = std::chrono::milliseconds(v.as<long>());
    if (auto v = node["multiplier"]) cfg.multiplier = v.as<double>();
    if (auto v = node["max_ms"])     cfg.max = std::chrono::milliseconds(v.as<long>());

    return cfg;
}

void validate_config(const AppConfig& cfg) {
    if (cfg.ble.adapter.empty())
        throw ConfigurationError("ble.adapter must not be empty");
    if (cfg.ble.scan_timeout_ms <= 0)
        throw ConfigurationError("ble.scan_timeout_ms must be positive");
    if (cfg.ble.connect_timeout_ms <= 0)
        throw ConfigurationError("ble.connect_timeout_ms must be positive");
    if (!cfg.ble.target_pattern.empty()) {
        try {
            std::regex re(cfg.ble.target_pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw ConfigurationError("ble.target_pattern is not a valid regex: " + std::string(e.what()));
        }
    }
    if (cfg.ble.malformed_tolerance < 0)
        throw ConfigurationError("ble.malformed_tolerance must not be negative");
    if (cfg.ble.max_connect_retries < 1)
        throw ConfigurationError("ble.max_connect_retries must be at least 1");

    if (cfg.osc.host.empty())
        throw ConfigurationError("osc.host must not be empty");
    if (cfg.osc.port < 1 || cfg.osc.port > 65535)
        throw ConfigurationError("osc.port out of range: " + std::to_string(cfg.osc.port));
    if (cfg.osc.bpm_parameter.empty() || cfg.osc.normalized_parameter.empty())
        throw ConfigurationError("osc parameter names must not be empty");

    if (cfg.normalize.mode == NormalizeMode::Linear && !(cfg.normalize.max_bpm > cfg.normalize.min_bpm))
        throw ConfigurationError("normalize.max_bpm must be greater than normalize.min_bpm");
    if (cfg.normalize.mode == NormalizeMode::WaitTime &&
        (!(cfg.normalize.hr_const > 0.0) || cfg.normalize.hr_flex < 0.0))
        throw ConfigurationError("normalize.hr_const must be positive and hr_flex non-negative");

    if (cfg.backoff.initial.count() <= 0)
        throw ConfigurationError("backoff.initial_ms must be positive");
    if (cfg.backoff.max < cfg.backoff.initial)
        throw ConfigurationError("backoff.max_ms must not be below backoff.initial_ms");
    if (cfg.backoff.kind == BackoffKind::Exponential && cfg.backoff.multiplier < 1.0)
        throw ConfigurationError("backoff.multiplier must be at least 1.0");
}

AppConfig load_config_from_node(const YAML::Node& root) {
    AppConfig cfg;
    try {
        if (root && !root.IsNull()) {
            if (!root.IsMap()) throw ConfigurationError("top-level YAML must be a map");
            cfg.ble = parse_ble(root["ble"]);
            cfg.osc = parse_osc(root["osc"]);
            cfg.normalize = parse_normalize(root["normalize"]);
            cfg.backoff = parse_backoff(root["backoff"]);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid config value: ") + e.what());
    }
    validate_config(cfg);
    return cfg;
}

AppConfig load_config_from_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        std::cerr << "[config] " << path << " not found; using defaults\n";
        AppConfig cfg;
        validate_config(cfg);
        return cfg;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("Failed to load YAML: ") + e.what());
    }

    std::cout << "[config] loaded " << path << "\n";
    return load_config_from_node(root);
}

const char* to_string(NormalizeMode mode) {
    switch (mode) {
    case NormalizeMode::Linear:   return "linear";
    case NormalizeMode::WaitTime: return "wait_time";
    }
    return "?";
}

const char* to_string(BackoffKind kind) {
    switch (kind) {
    case BackoffKind::Fixed:       return "fixed";
    case BackoffKind::Exponential: return "exponential";
    }
    return "?";
}
