#pragma once

#include <expected>
#include <optional>
#include <string>

enum class ConfigErrc {
    MissingCredential,
    OutOfRange,
    InvalidValue,
    InvalidFileFormat,
    IoError,
    NoHomeDirectory,
};

struct ConfigError {
    ConfigErrc code;
    std::string field;  // OutOfRange / InvalidValue / offending file key
    std::string path;   // file errors
    std::string detail;

    std::string describe() const;

    static ConfigError missing_credential();
    static ConfigError out_of_range(std::string field, std::string detail);
    static ConfigError invalid_value(std::string field, std::string detail);
    static ConfigError invalid_format(std::string path, std::string detail, std::string field = {});
    static ConfigError io(std::string path, std::string detail);
    static ConfigError no_home();
};

const char* to_string(ConfigErrc code);

namespace defaults {

inline constexpr const char* kEndpoint = "https://api.openai.com";
inline constexpr const char* kChatPath = "/v1/chat/completions";
inline constexpr const char* kModel = "gpt-3.5-turbo";
inline constexpr int kMaxTokens = 2048;
inline constexpr double kTemperature = 0.7;
inline constexpr double kTopP = 1.0;
inline constexpr double kFrequencyPenalty = 0.0;
inline constexpr double kPresencePenalty = 0.0;
inline constexpr double kTimeoutSeconds = 30.0;

} // namespace defaults

struct ConfigRecord {
    std::string api_key;
    std::string endpoint = defaults::kEndpoint;
    std::string model = defaults::kModel;
    int max_tokens = defaults::kMaxTokens;
    double temperature = defaults::kTemperature;
    double top_p = defaults::kTopP;
    double frequency_penalty = defaults::kFrequencyPenalty;
    double presence_penalty = defaults::kPresencePenalty;
    std::optional<std::string> stop_sequence;
    double timeout_seconds = defaults::kTimeoutSeconds;
    std::optional<std::string> organization;

    // Built-in defaults. api_key is left empty and never used by the resolver.
    static ConfigRecord builtin_defaults() { return ConfigRecord{}; }

    std::expected<void, ConfigError> validate() const;

    // endpoint + "/v1/chat/completions", tolerating a trailing slash on endpoint.
    std::string completions_url() const;

    bool operator==(const ConfigRecord&) const = default;
};

// Every field optional; one per source (cli, environment, file) during a resolution.
struct PartialConfig {
    std::optional<std::string> api_key;
    std::optional<std::string> endpoint;
    std::optional<std::string> model;
    std::optional<int> max_tokens;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<double> frequency_penalty;
    std::optional<double> presence_penalty;
    std::optional<std::string> stop_sequence;
    std::optional<double> timeout_seconds;
    std::optional<std::string> organization;

    bool empty() const;

    bool operator==(const PartialConfig&) const = default;
};
