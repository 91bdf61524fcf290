#pragma once

#include <optional>
#include <string>

namespace platform {

// $xdg_config_home/winston when it is an absolute path, otherwise
// $home/.config/winston. Empty when neither is usable.
std::string config_dir(const std::optional<std::string>& xdg_config_home,
                       const std::optional<std::string>& home);

// $HOME, or the passwd entry of the current user when HOME is unset.
std::optional<std::string> home_dir();

} // namespace platform
