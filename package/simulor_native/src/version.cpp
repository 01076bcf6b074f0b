#include "simulor_native/version.hpp"
#include "simulor_native/build_info.hpp"

#include <fmt/format.h>
#include <limits>
#include <stdexcept>
#include <string>

namespace simulor_native {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_ident_char(char c) {
  return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         c == '-';
}

int parse_component(std::string_view part, std::string_view text,
                    const char *what) {
  if (part.empty()) {
    throw std::invalid_argument(
        fmt::format("version '{}': missing {} component", text, what));
  }
  if (part.size() > 1 && part.front() == '0') {
    throw std::invalid_argument(
        fmt::format("version '{}': leading zero in {} component", text, what));
  }
  long long value = 0;
  for (char c : part) {
    if (!is_digit(c)) {
      throw std::invalid_argument(fmt::format(
          "version '{}': {} component '{}' is not numeric", text, what, part));
    }
    value = value * 10 + (c - '0');
    if (value > std::numeric_limits<int>::max()) {
      throw std::invalid_argument(fmt::format(
          "version '{}': {} component out of range", text, what));
    }
  }
  return static_cast<int>(value);
}

// Dot-separated identifiers, each non-empty and [0-9A-Za-z-].
void check_identifiers(std::string_view ids, std::string_view text,
                       const char *what) {
  if (ids.empty()) {
    throw std::invalid_argument(
        fmt::format("version '{}': empty {}", text, what));
  }
  std::size_t start = 0;
  while (true) {
    const std::size_t dot = ids.find('.', start);
    const std::string_view id = ids.substr(
        start, dot == std::string_view::npos ? std::string_view::npos
                                             : dot - start);
    if (id.empty()) {
      throw std::invalid_argument(
          fmt::format("version '{}': empty identifier in {}", text, what));
    }
    for (char c : id) {
      if (!is_ident_char(c)) {
        throw std::invalid_argument(fmt::format(
            "version '{}': invalid character '{}' in {}", text, c, what));
      }
    }
    if (dot == std::string_view::npos)
      break;
    start = dot + 1;
  }
}

} // namespace

std::string Version::to_string() const {
  std::string out = fmt::format("{}.{}.{}", major, minor, patch);
  if (!prerelease.empty())
    out += "-" + prerelease;
  if (!build.empty())
    out += "+" + build;
  return out;
}

bool operator==(const Version &a, const Version &b) {
  return a.major == b.major && a.minor == b.minor && a.patch == b.patch &&
         a.prerelease == b.prerelease && a.build == b.build;
}

bool operator!=(const Version &a, const Version &b) { return !(a == b); }

Version parse_version(std::string_view text) {
  if (text.empty()) {
    throw std::invalid_argument("version: empty text");
  }

  std::string_view core = text;
  std::string_view build;
  std::string_view prerelease;
  bool has_build = false;
  bool has_prerelease = false;

  const std::size_t plus = core.find('+');
  if (plus != std::string_view::npos) {
    build = core.substr(plus + 1);
    core = core.substr(0, plus);
    has_build = true;
  }
  const std::size_t dash = core.find('-');
  if (dash != std::string_view::npos) {
    prerelease = core.substr(dash + 1);
    core = core.substr(0, dash);
    has_prerelease = true;
  }

  const std::size_t dot1 = core.find('.');
  const std::size_t dot2 =
      dot1 == std::string_view::npos ? dot1 : core.find('.', dot1 + 1);
  if (dot1 == std::string_view::npos || dot2 == std::string_view::npos) {
    throw std::invalid_argument(fmt::format(
        "version '{}': expected MAJOR.MINOR.PATCH", text));
  }

  Version v;
  v.major = parse_component(core.substr(0, dot1), text, "major");
  v.minor = parse_component(core.substr(dot1 + 1, dot2 - dot1 - 1), text,
                            "minor");
  v.patch = parse_component(core.substr(dot2 + 1), text, "patch");

  if (has_prerelease) {
    check_identifiers(prerelease, text, "prerelease");
    v.prerelease = std::string(prerelease);
  }
  if (has_build) {
    check_identifiers(build, text, "build metadata");
    v.build = std::string(build);
  }
  return v;
}

const std::string &version_string() {
  static const std::string version{SIMULOR_NATIVE_VERSION};
  return version;
}

const Version &build_version() {
  static const Version version = parse_version(version_string());
  return version;
}

} // namespace simulor_native
