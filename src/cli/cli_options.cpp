#include "cli_options.hpp"

#include <charconv>
#include <cstdio>
#include <print>
#include <string_view>

namespace {

template <typename T>
std::expected<T, std::string> parse_number(std::string_view flag, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::unexpected(std::string(flag) + ": not a number: '" + std::string(text) + "'");
    }
    return value;
}

} // namespace

void print_usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] [show|save|path]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  show                          Print the resolved configuration (default)");
    std::println(stderr, "  save                          Resolve and write the configuration file");
    std::println(stderr, "  path                          Print the configuration file path");
    std::println(stderr, "Options:");
    std::println(stderr, "  -k, --api-key KEY             API key (env: OPENAI_API_KEY)");
    std::println(stderr, "  -e, --endpoint URL            API base URL");
    std::println(stderr, "  -m, --model NAME              Model identifier (env: OPENAI_MODEL)");
    std::println(stderr, "  -l, --max-tokens N            Maximum tokens to generate");
    std::println(stderr, "  -t, --temperature X           Sampling temperature [0, 2]");
    std::println(stderr, "  -p, --top-p X                 Nucleus sampling [0, 1]");
    std::println(stderr, "  -f, --frequency-penalty X     Frequency penalty [-2, 2]");
    std::println(stderr, "  -r, --presence-penalty X      Presence penalty [-2, 2]");
    std::println(stderr, "  -d, --stop SEQ                Stop sequence");
    std::println(stderr, "  -T, --timeout SECONDS         Request timeout");
    std::println(stderr, "  -o, --organization ID         Organization ID");
    std::println(stderr, "  -c, --config PATH             Config file path");
    std::println(stderr, "  -s, --sources                 Show where each value came from");
    std::println(stderr, "  -v, --verbose                 Enable verbose logging");
    std::println(stderr, "  -h, --help                    Show this help");
}

std::expected<CliOptions, std::string> parse_args(int argc, const char* const argv[]) {
    CliOptions opts;
    bool have_command = false;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];

        auto value = [&]() -> std::expected<std::string_view, std::string> {
            if (i + 1 >= argc) {
                return std::unexpected(std::string(arg) + ": missing value");
            }
            return std::string_view(argv[++i]);
        };

        auto set_string = [&](std::optional<std::string>& out) -> std::expected<void, std::string> {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            out = std::string(*v);
            return {};
        };

        auto set_double = [&](std::optional<double>& out) -> std::expected<void, std::string> {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto n = parse_number<double>(arg, *v);
            if (!n) return std::unexpected(n.error());
            out = *n;
            return {};
        };

        std::expected<void, std::string> r;
        auto& o = opts.overrides;

        if (arg == "--api-key" || arg == "-k") {
            r = set_string(o.api_key);
        } else if (arg == "--endpoint" || arg == "-e") {
            r = set_string(o.endpoint);
        } else if (arg == "--model" || arg == "-m") {
            r = set_string(o.model);
        } else if (arg == "--max-tokens" || arg == "-l") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto n = parse_number<int>(arg, *v);
            if (!n) return std::unexpected(n.error());
            o.max_tokens = *n;
        } else if (arg == "--temperature" || arg == "-t") {
            r = set_double(o.temperature);
        } else if (arg == "--top-p" || arg == "-p") {
            r = set_double(o.top_p);
        } else if (arg == "--frequency-penalty" || arg == "-f") {
            r = set_double(o.frequency_penalty);
        } else if (arg == "--presence-penalty" || arg == "-r") {
            r = set_double(o.presence_penalty);
        } else if (arg == "--stop" || arg == "-d") {
            r = set_string(o.stop_sequence);
        } else if (arg == "--timeout" || arg == "-T") {
            r = set_double(o.timeout_seconds);
        } else if (arg == "--organization" || arg == "-o") {
            r = set_string(o.organization);
        } else if (arg == "--config" || arg == "-c") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            opts.config_path = std::string(*v);
        } else if (arg == "--sources" || arg == "-s") {
            opts.show_sources = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return std::unexpected("unknown option: " + std::string(arg));
        } else if (have_command) {
            return std::unexpected("unexpected argument: " + std::string(arg));
        } else {
            if (arg == "show") {
                opts.command = Command::Show;
            } else if (arg == "save") {
                opts.command = Command::Save;
            } else if (arg == "path") {
                opts.command = Command::Path;
            } else {
                return std::unexpected("unknown command: " + std::string(arg));
            }
            have_command = true;
        }

        if (!r) return std::unexpected(r.error());
    }

    return opts;
}
