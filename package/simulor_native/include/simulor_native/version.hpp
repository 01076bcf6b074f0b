#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace simulor_native {

// Semantic version: MAJOR.MINOR.PATCH[-prerelease][+build]
struct Version {
  int major{0};
  int minor{0};
  int patch{0};
  std::string prerelease;
  std::string build;

  Version() = default;
  Version(int major_, int minor_, int patch_, std::string prerelease_ = {},
          std::string build_ = {})
      : major(major_), minor(minor_), patch(patch_),
        prerelease(std::move(prerelease_)), build(std::move(build_)) {}

  std::string to_string() const;
};

bool operator==(const Version &a, const Version &b);
bool operator!=(const Version &a, const Version &b);

// Throws std::invalid_argument if text is not semver-shaped. Surrounding
// whitespace is rejected rather than trimmed.
Version parse_version(std::string_view text);

// Version declared by the build configuration, verbatim.
const std::string &version_string();

// Parsed form of version_string(). Throws std::invalid_argument if the
// build configuration declared a malformed version.
const Version &build_version();

} // namespace simulor_native
