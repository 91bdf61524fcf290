#include "environment.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>

static std::optional<std::string> non_empty_env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

Environment Environment::capture() {
    return Environment{
        .openai_api_key = non_empty_env("OPENAI_API_KEY"),
        .openai_model = non_empty_env("OPENAI_MODEL"),
        .xdg_config_home = non_empty_env("XDG_CONFIG_HOME"),
        .home = platform::home_dir(),
    };
}

PartialConfig Environment::to_partial() const {
    PartialConfig p;
    p.api_key = openai_api_key;
    p.model = openai_model;
    return p;
}
