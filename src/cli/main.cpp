#include "cli_options.hpp"
#include "config_record.hpp"
#include "config_resolver.hpp"
#include "environment.hpp"

#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>

namespace fs = std::filesystem;

static bool g_verbose = false;

static void debug(const std::string& msg) {
    if (g_verbose) {
        std::println(stderr, "[winston] {}", msg);
    }
}

static int fail(const ConfigError& err) {
    std::println(stderr, "winston: {}", err.describe());
    return 1;
}

static std::string mask_secret(const std::string& secret) {
    if (secret.size() <= 8) return std::string(secret.size(), '*');
    return secret.substr(0, 3) + "..." + secret.substr(secret.size() - 4);
}

static std::string quoted(const std::string& s) {
    try {
        return nlohmann::json(s).dump();
    } catch (const nlohmann::json::type_error&) {
        return "(invalid UTF-8)";
    }
}

static void print_record(const TracedConfig& traced, bool with_sources) {
    const ConfigRecord& r = traced.record;

    auto line = [&](const char* key, const std::string& value) {
        if (with_sources) {
            auto it = traced.sources.find(key);
            const char* src = it != traced.sources.end() ? to_string(it->second) : "-";
            std::println("{:<18} {:<40} ({})", key, value, src);
        } else {
            std::println("{:<18} {}", key, value);
        }
    };

    line("api_key", mask_secret(r.api_key));
    line("endpoint", r.endpoint);
    line("model", r.model);
    line("max_tokens", std::to_string(r.max_tokens));
    line("temperature", std::format("{}", r.temperature));
    line("top_p", std::format("{}", r.top_p));
    line("frequency_penalty", std::format("{}", r.frequency_penalty));
    line("presence_penalty", std::format("{}", r.presence_penalty));
    line("stop_sequence", r.stop_sequence ? quoted(*r.stop_sequence) : "(none)");
    line("timeout", std::format("{}s", r.timeout_seconds));
    line("organization", r.organization.value_or("(none)"));
    std::println("{:<18} {}", "completions_url", r.completions_url());
}

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::println(stderr, "winston: {}", parsed.error());
        print_usage(argv[0]);
        return 1;
    }
    CliOptions opts = std::move(*parsed);
    g_verbose = opts.verbose;

    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto env = Environment::capture();

    fs::path config_path;
    if (!opts.config_path.empty()) {
        config_path = opts.config_path;
    } else {
        auto def = ConfigResolver::default_path(env);
        if (!def) return fail(def.error());
        config_path = *def;
    }

    if (opts.command == Command::Path) {
        std::println("{}", config_path.string());
        return 0;
    }

    auto file = ConfigResolver::load_from_file(config_path);
    if (!file) return fail(file.error());
    if (file->empty()) {
        debug("No settings from " + config_path.string());
    } else {
        debug("Loaded " + config_path.string());
    }

    // Built once; resolution never reaches for hidden globals.
    const ConfigRecord defaults = ConfigRecord::builtin_defaults();

    auto resolved = ConfigResolver::resolve_traced(opts.overrides, env.to_partial(), *file, defaults);
    if (!resolved) return fail(resolved.error());

    for (const auto& [key, source] : resolved->sources) {
        debug(std::format("{} from {}", key, to_string(source)));
    }

    if (opts.command == Command::Save) {
        auto saved = ConfigResolver::save_to_file(resolved->record, config_path);
        if (!saved) return fail(saved.error());
        std::println("Saved configuration to {}", config_path.string());
        return 0;
    }

    print_record(*resolved, opts.show_sources);
    return 0;
}
