#pragma once

#include "config_record.hpp"

#include <expected>
#include <string>

enum class Command { Show, Save, Path };

struct CliOptions {
    Command command = Command::Show;
    PartialConfig overrides;
    std::string config_path; // empty: derive the default path
    bool show_sources = false;
    bool verbose = false;
    bool help = false;
};

// argv[0] is skipped. Errors are human-readable and meant for stderr.
std::expected<CliOptions, std::string> parse_args(int argc, const char* const argv[]);

void print_usage(const char* prog);
