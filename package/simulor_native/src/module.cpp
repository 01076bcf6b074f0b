#include "simulor_native/module.hpp"
#include "simulor_native/config.hpp"
#include "simulor_native/log.hpp"
#include "simulor_native/version.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace simulor_native {

bool ModuleSink::contains(const std::string &key) const {
  return nb::hasattr(module_, key.c_str());
}

void ModuleSink::insert(const Binding &binding) {
  try {
    nb::setattr(module_, binding.key.c_str(),
                nb::str(binding.value.c_str(), binding.value.size()));
  } catch (const nb::python_error &e) {
    throw InitError(fmt::format("cannot bind '{}' on module: {}", binding.key,
                                e.what()));
  }
}

void initialize(nb::module_ &m) {
  try {
    const BuildConfig &cfg = build_config();
    const Version &v = build_version();
    log_debug("initializing {} {}", cfg.module_name, v.to_string());
  } catch (const std::invalid_argument &e) {
    throw InitError(fmt::format("malformed build configuration: {}", e.what()));
  }

  ModuleSink sink(m);
  try {
    register_bindings(published_bindings(), sink);
  } catch (const InitError &e) {
    log_error("initialization failed: {}", e.what());
    throw;
  }
}

} // namespace simulor_native
