#pragma once

#include <string>

#include "simulor_native/log.hpp"

namespace simulor_native {

// Settings fixed by the build configuration. There is no runtime source.
struct BuildConfig {
  std::string module_name;
  std::string version;
  LogLevel log_level{LogLevel::warn};
};

// Throws std::invalid_argument if SIMULOR_NATIVE_LOG_LEVEL was configured
// with an unknown level name.
const BuildConfig &build_config();

} // namespace simulor_native
