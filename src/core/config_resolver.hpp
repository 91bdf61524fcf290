#pragma once

#include "config_record.hpp"
#include "environment.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

enum class Source { Cli, Environment, File, Default };

const char* to_string(Source source);

// Resolved record plus the source that supplied each field, keyed by file key name.
struct TracedConfig {
    ConfigRecord record;
    std::map<std::string, Source> sources;
};

// Merges cli > environment > file > defaults into one validated ConfigRecord and
// persists records as flat JSON. Stateless; every call is independent.
class ConfigResolver {
public:
    static std::expected<ConfigRecord, ConfigError>
        resolve(const PartialConfig& cli, const PartialConfig& env,
                const std::optional<PartialConfig>& file, const ConfigRecord& defaults);

    static std::expected<TracedConfig, ConfigError>
        resolve_traced(const PartialConfig& cli, const PartialConfig& env,
                       const std::optional<PartialConfig>& file, const ConfigRecord& defaults);

    // A missing file yields an empty PartialConfig.
    static std::expected<PartialConfig, ConfigError> load_from_file(const std::filesystem::path& path);

    // Atomic replace: readers see either the old file or the complete new one.
    static std::expected<void, ConfigError> save_to_file(const ConfigRecord& record,
                                                         const std::filesystem::path& path);

    static std::expected<std::filesystem::path, ConfigError> default_path(const Environment& env);

    static constexpr const char* kFileName = "config.json";
};
