#pragma once

#include "config.hpp"
#include <string>

namespace pushscribe {

// $XDG_CONFIG_HOME/pushscribe/settings.json, falling back to
// ~/.config/pushscribe/settings.json
std::string default_settings_path();

// Merge a JSON settings document into `config`. Unknown keys are ignored and
// missing keys keep their current values. On failure `config` is left
// untouched and `error` says why.
bool parse_settings(const std::string& json_text, Config& config, std::string& error);

// Pretty-printed JSON with every persisted setting
std::string serialize_settings(const Config& config);

// Returns false if the file is missing or unreadable (config unchanged)
bool load_settings(const std::string& path, Config& config);

// Creates the parent directory if needed
bool save_settings(const std::string& path, const Config& config);

// OPENAI_API_KEY fills in the API key when the settings file has none
void apply_environment(Config& config);

} // namespace pushscribe
