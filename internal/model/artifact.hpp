#pragma once

#include <string>
#include <string_view>

namespace registry::model {

constexpr std::size_t kMaxNameLength    = 255;
constexpr std::size_t kMaxVersionLength = 64;

/*
  Canonical package name: lower case, runs of '_', '.' and '-' collapsed to
  a single '-'. "Left_Pad" and "left-pad" name the same package.

  Throws std::invalid_argument when the result is empty, too long, or
  contains anything outside [a-z0-9-], or starts/ends with '-'.
*/
std::string NormalizeName(std::string_view name);

/*
  Trims and validates a version string for storage. The version must parse
  under registry::version::Version.
*/
std::string NormalizeVersion(std::string_view version);

} // namespace registry::model
