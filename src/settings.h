#pragma once

#include <string>

#include "droid_messenger.h"

// $XDG_CONFIG_HOME/DroidVox/settings.ini (directory created on demand)
std::string settings_path();

// Missing file or keys leave the corresponding fields untouched.
bool settings_load(DroidSettings& settings);
bool settings_save(const DroidSettings& settings);
