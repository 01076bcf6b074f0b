#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace simulor_native {

// Raised when the module namespace cannot take the published bindings. Fatal
// to the import.
class InitError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Key of the version marker published into the module namespace.
inline constexpr const char *kVersionKey = "__version__";

struct Binding {
  std::string key;
  std::string value;

  Binding() = default;
  Binding(std::string key_, std::string value_)
      : key(std::move(key_)), value(std::move(value_)) {}
};

// Namespace that receives bindings, e.g. a Python module object.
class BindingSink {
public:
  virtual ~BindingSink() = default;

  virtual bool contains(const std::string &key) const = 0;
  virtual void insert(const Binding &binding) = 0;
};

// Everything the extension publishes on import.
std::vector<Binding> published_bindings();

// All-or-nothing: every binding is checked before the first insert. Throws
// InitError on an empty or repeated key, on a key the sink already holds, or
// when the sink rejects an insert.
void register_bindings(const std::vector<Binding> &bindings,
                       BindingSink &sink);

} // namespace simulor_native
