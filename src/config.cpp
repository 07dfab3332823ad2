#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace patchkit {

nlohmann::json Config::defaults_json() {
    return {
        {"match", {
            {"fuzzy_threshold", 0.8},
            {"window_tolerance", 1},
            {"normalized", true},
            {"fuzzy", true},
            {"line_range", true},
            {"key_line_anchoring", true}
        }},
        {"prompt", {
            {"line_number_threshold", 300}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Non-negative integer; literals in code are stored signed, parsed ones unsigned
static bool is_count(const nlohmann::json& v) {
    return v.is_number_integer() && v.get<int64_t>() >= 0;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("match") && j["match"].is_object()) {
        auto& m = j["match"];
        if (m.contains("fuzzy_threshold") && m["fuzzy_threshold"].is_number())
            cfg.match.fuzzy_threshold = std::clamp(m["fuzzy_threshold"].get<double>(), 0.0, 1.0);
        if (m.contains("window_tolerance") && is_count(m["window_tolerance"]))
            cfg.match.window_tolerance = static_cast<uint32_t>(
                std::min<int64_t>(m["window_tolerance"].get<int64_t>(), 1000));
        if (m.contains("normalized") && m["normalized"].is_boolean())
            cfg.match.normalized = m["normalized"].get<bool>();
        if (m.contains("fuzzy") && m["fuzzy"].is_boolean())
            cfg.match.fuzzy = m["fuzzy"].get<bool>();
        if (m.contains("line_range") && m["line_range"].is_boolean())
            cfg.match.line_range = m["line_range"].get<bool>();
        if (m.contains("key_line_anchoring") && m["key_line_anchoring"].is_boolean())
            cfg.match.key_line_anchoring = m["key_line_anchoring"].get<bool>();
    }

    if (j.contains("prompt") && j["prompt"].is_object()) {
        auto& p = j["prompt"];
        if (p.contains("line_number_threshold") && is_count(p["line_number_threshold"]))
            cfg.prompt.line_number_threshold = static_cast<uint32_t>(
                std::min<int64_t>(p["line_number_threshold"].get<int64_t>(), 1000000));
    }

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("PATCHKIT_FUZZY_THRESHOLD")) {
        try {
            match.fuzzy_threshold = std::clamp(std::stod(v), 0.0, 1.0);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid PATCHKIT_FUZZY_THRESHOLD: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("PATCHKIT_WINDOW_TOLERANCE")) {
        try {
            unsigned long n = std::stoul(v);
            match.window_tolerance = static_cast<uint32_t>(std::min<unsigned long>(n, 1000));
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid PATCHKIT_WINDOW_TOLERANCE: " << v << "\n";
        }
    }
}

Config Config::load() {
    std::string config_path = expand_home("~/.patchkit/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

} // namespace patchkit
