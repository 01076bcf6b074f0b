#include "simulor_native/module.hpp"

#include <nanobind/nanobind.h>

// Test extension whose namespace already holds the version key when the
// bootstrap runs, so initialize() must fail the import.
NB_MODULE(_simulor_native_conflict, m) {
  m.attr(simulor_native::kVersionKey) = "x";
  simulor_native::initialize(m);
}
