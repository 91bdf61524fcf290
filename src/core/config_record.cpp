#include "config_record.hpp"

#include <format>
#include <limits>
#include <nlohmann/json.hpp>

namespace {

// Written as a positive range test so NaN falls outside.
bool in_range(double v, double lo, double hi) {
    return v >= lo && v <= hi;
}

std::expected<void, ConfigError> check_range(const char* field, double v, double lo, double hi) {
    if (!in_range(v, lo, hi)) {
        return std::unexpected(ConfigError::out_of_range(
            field, std::format("{} is outside [{}, {}]", v, lo, hi)));
    }
    return {};
}

// Strings end up in a JSON document, which must be valid UTF-8.
bool valid_utf8(const std::string& s) {
    try {
        (void)nlohmann::json(s).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

std::expected<void, ConfigError> check_text(const char* field, const std::optional<std::string>& s) {
    if (s && !valid_utf8(*s)) {
        return std::unexpected(ConfigError::invalid_value(field, "not valid UTF-8"));
    }
    return {};
}

} // namespace

const char* to_string(ConfigErrc code) {
    switch (code) {
        case ConfigErrc::MissingCredential: return "missing credential";
        case ConfigErrc::OutOfRange: return "value out of range";
        case ConfigErrc::InvalidValue: return "invalid value";
        case ConfigErrc::InvalidFileFormat: return "invalid config file";
        case ConfigErrc::IoError: return "I/O error";
        case ConfigErrc::NoHomeDirectory: return "no home directory";
    }
    return "unknown error";
}

std::string ConfigError::describe() const {
    switch (code) {
        case ConfigErrc::MissingCredential:
            return "missing credential: no API key given (use --api-key, set OPENAI_API_KEY, "
                   "or add \"api_key\" to the config file)";
        case ConfigErrc::OutOfRange:
        case ConfigErrc::InvalidValue:
            return std::format("{} for '{}': {}", to_string(code), field, detail);
        case ConfigErrc::InvalidFileFormat:
            if (!field.empty()) {
                return std::format("{} {}: key '{}': {}", to_string(code), path, field, detail);
            }
            return std::format("{} {}: {}", to_string(code), path, detail);
        case ConfigErrc::IoError:
            return std::format("{} on {}: {}", to_string(code), path, detail);
        case ConfigErrc::NoHomeDirectory:
            return "no home directory: set XDG_CONFIG_HOME or HOME, or pass --config";
    }
    return to_string(code);
}

ConfigError ConfigError::missing_credential() {
    return ConfigError{.code = ConfigErrc::MissingCredential, .field = "api_key", .path = {}, .detail = {}};
}

ConfigError ConfigError::out_of_range(std::string field, std::string detail) {
    return ConfigError{.code = ConfigErrc::OutOfRange, .field = std::move(field),
                       .path = {}, .detail = std::move(detail)};
}

ConfigError ConfigError::invalid_value(std::string field, std::string detail) {
    return ConfigError{.code = ConfigErrc::InvalidValue, .field = std::move(field),
                       .path = {}, .detail = std::move(detail)};
}

ConfigError ConfigError::invalid_format(std::string path, std::string detail, std::string field) {
    return ConfigError{.code = ConfigErrc::InvalidFileFormat, .field = std::move(field),
                       .path = std::move(path), .detail = std::move(detail)};
}

ConfigError ConfigError::io(std::string path, std::string detail) {
    return ConfigError{.code = ConfigErrc::IoError, .field = {},
                       .path = std::move(path), .detail = std::move(detail)};
}

ConfigError ConfigError::no_home() {
    return ConfigError{.code = ConfigErrc::NoHomeDirectory, .field = {}, .path = {}, .detail = {}};
}

std::expected<void, ConfigError> ConfigRecord::validate() const {
    if (api_key.empty()) {
        return std::unexpected(ConfigError::missing_credential());
    }

    if (auto r = check_text("api_key", api_key); !r) return r;
    if (auto r = check_text("endpoint", endpoint); !r) return r;
    if (auto r = check_text("model", model); !r) return r;
    if (auto r = check_text("stop_sequence", stop_sequence); !r) return r;
    if (auto r = check_text("organization", organization); !r) return r;

    if (!endpoint.starts_with("http://") && !endpoint.starts_with("https://")) {
        return std::unexpected(ConfigError::invalid_value(
            "endpoint", std::format("'{}' is not an http(s) URL", endpoint)));
    }
    if (model.empty()) {
        return std::unexpected(ConfigError::invalid_value("model", "must not be empty"));
    }

    if (max_tokens <= 0) {
        return std::unexpected(ConfigError::out_of_range(
            "max_tokens", std::format("{} is not a positive integer", max_tokens)));
    }

    if (auto r = check_range("temperature", temperature, 0.0, 2.0); !r) return r;
    if (auto r = check_range("top_p", top_p, 0.0, 1.0); !r) return r;
    if (auto r = check_range("frequency_penalty", frequency_penalty, -2.0, 2.0); !r) return r;
    if (auto r = check_range("presence_penalty", presence_penalty, -2.0, 2.0); !r) return r;

    // Positive and finite; NaN and inf both fail.
    if (!(timeout_seconds > 0.0 && timeout_seconds < std::numeric_limits<double>::infinity())) {
        return std::unexpected(ConfigError::out_of_range(
            "timeout_seconds", std::format("{} is not a positive number of seconds", timeout_seconds)));
    }

    return {};
}

std::string ConfigRecord::completions_url() const {
    std::string base = endpoint;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + defaults::kChatPath;
}

bool PartialConfig::empty() const {
    return !api_key && !endpoint && !model && !max_tokens && !temperature && !top_p &&
           !frequency_penalty && !presence_penalty && !stop_sequence && !timeout_seconds &&
           !organization;
}
