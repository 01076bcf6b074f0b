#include "simulor_native/module.hpp"

#include <nanobind/nanobind.h>

// The NB_MODULE macro defines PyInit__simulor_native, the entry point the
// Python loader looks up. No docstring is set: the only change to the module
// namespace is the version binding.
NB_MODULE(_simulor_native, m) { simulor_native::initialize(m); }
