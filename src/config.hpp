#pragma once
#include "match_strategy.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace patchkit {

struct PromptConfig {
    uint32_t line_number_threshold = 300; // number lines of files longer than this
};

struct Config {
    MatchOptions match;
    PromptConfig prompt;

    // Load from ~/.patchkit/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document; unknown or mistyped keys keep their defaults
    static Config from_json(const nlohmann::json& j);

    // Apply PATCHKIT_* environment overrides
    void apply_env();
};

} // namespace patchkit
