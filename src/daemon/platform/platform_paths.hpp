#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/activity-watcher, or ~/.config/activity-watcher.
std::string config_dir();

} // namespace platform
