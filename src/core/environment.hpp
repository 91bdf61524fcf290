#pragma once

#include "config_record.hpp"

#include <optional>
#include <string>

// Snapshot of the process environment, taken once before resolution.
struct Environment {
    std::optional<std::string> openai_api_key;
    std::optional<std::string> openai_model;
    std::optional<std::string> xdg_config_home;
    std::optional<std::string> home;

    // Reads OPENAI_API_KEY, OPENAI_MODEL, XDG_CONFIG_HOME and the home directory.
    // Empty variables are treated as unset.
    static Environment capture();

    // Only the credential and the model are configuration fields; the directory
    // variables are used for path derivation.
    PartialConfig to_partial() const;
};
