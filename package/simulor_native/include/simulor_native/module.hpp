#pragma once

#include <nanobind/nanobind.h>

#include "simulor_native/registry.hpp"

namespace nb = nanobind;

namespace simulor_native {

// BindingSink over a Python module object.
class ModuleSink : public BindingSink {
public:
  explicit ModuleSink(nb::module_ &m) : module_(m) {}

  bool contains(const std::string &key) const override;
  // Translates nb::python_error into InitError.
  void insert(const Binding &binding) override;

private:
  nb::module_ &module_;
};

// Module initializer run once by the NB_MODULE entry point. Publishes
// __version__ and nothing else; throws InitError on failure, which the entry
// point reports to the importer as ImportError.
void initialize(nb::module_ &m);

} // namespace simulor_native
