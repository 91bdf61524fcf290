#pragma once

#include "config_record.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Flat JSON object, one key per field. `source` names the file in errors.
namespace config_file {

std::expected<PartialConfig, ConfigError> parse(const std::string& text, const std::string& source);

// Canonical keys only; optional fields are omitted when absent.
nlohmann::json to_json(const ConfigRecord& record);

// Fails with InvalidValue naming the field when a string is not valid UTF-8.
std::expected<std::string, ConfigError> serialize(const ConfigRecord& record);

} // namespace config_file
