#include "simulor_native/registry.hpp"
#include "simulor_native/log.hpp"
#include "simulor_native/version.hpp"

#include <fmt/format.h>
#include <unordered_set>

namespace simulor_native {

std::vector<Binding> published_bindings() {
  return {Binding(kVersionKey, version_string())};
}

void register_bindings(const std::vector<Binding> &bindings,
                       BindingSink &sink) {
  std::unordered_set<std::string> seen;
  seen.reserve(bindings.size());
  for (const auto &b : bindings) {
    if (b.key.empty()) {
      throw InitError("cannot register a binding with an empty key");
    }
    if (!seen.insert(b.key).second) {
      throw InitError(fmt::format("binding '{}' is listed twice", b.key));
    }
    if (sink.contains(b.key)) {
      throw InitError(
          fmt::format("binding '{}' is already present in the namespace",
                      b.key));
    }
  }

  for (const auto &b : bindings) {
    try {
      sink.insert(b);
    } catch (const InitError &) {
      throw;
    } catch (const std::exception &e) {
      throw InitError(
          fmt::format("failed to register binding '{}': {}", b.key, e.what()));
    }
    log_debug("registered {} = '{}'", b.key, b.value);
  }
}

} // namespace simulor_native
