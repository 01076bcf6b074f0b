#include "simulor_native/config.hpp"
#include "simulor_native/build_info.hpp"
#include "simulor_native/version.hpp"

namespace simulor_native {

namespace {

BuildConfig load_build_config() {
  BuildConfig cfg;
  cfg.module_name = SIMULOR_NATIVE_MODULE_NAME;
  cfg.version = version_string();
  cfg.log_level = parse_log_level(SIMULOR_NATIVE_LOG_LEVEL);
  return cfg;
}

} // namespace

const BuildConfig &build_config() {
  static const BuildConfig cfg = load_build_config();
  return cfg;
}

} // namespace simulor_native
