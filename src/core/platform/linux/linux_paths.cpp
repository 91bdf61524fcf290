#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace platform {

std::string config_dir(const std::optional<std::string>& xdg_config_home,
                       const std::optional<std::string>& home) {
    // Relative XDG_CONFIG_HOME values are ignored.
    if (xdg_config_home && xdg_config_home->starts_with('/')) {
        return *xdg_config_home + "/winston";
    }
    if (!home || home->empty()) return {};
    return *home + "/.config/winston";
}

std::optional<std::string> home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home);

    long bufsize = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufsize <= 0) bufsize = 16384;
    std::vector<char> buf(static_cast<size_t>(bufsize));

    passwd pw{};
    passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pw, buf.data(), buf.size(), &result) != 0 || !result) {
        return std::nullopt;
    }
    if (!pw.pw_dir || !*pw.pw_dir) return std::nullopt;
    return std::string(pw.pw_dir);
}

} // namespace platform
