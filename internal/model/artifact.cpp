#include "artifact.hpp"

#include <cctype>
#include <stdexcept>

#include "internal/version/version.hpp"

namespace registry::model {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

} // namespace

std::string NormalizeName(std::string_view name) {
  name = Trim(name);

  std::string out;
  out.reserve(name.size());
  for (char raw : name) {
    const auto c = static_cast<unsigned char>(raw);
    if (c == '_' || c == '.' || c == '-') {
      if (!out.empty() && out.back() == '-') continue;
      out.push_back('-');
      continue;
    }
    if (!std::isalnum(c)) {
      throw std::invalid_argument("package name contains invalid character: '" + std::string(name) + "'");
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }

  if (out.empty()) {
    throw std::invalid_argument("package name must not be empty");
  }
  if (out.size() > kMaxNameLength) {
    throw std::invalid_argument("package name exceeds 255 characters");
  }
  if (out.front() == '-' || out.back() == '-') {
    throw std::invalid_argument("package name must start and end with a letter or digit: '" + std::string(name) + "'");
  }
  return out;
}

std::string NormalizeVersion(std::string_view version) {
  version = Trim(version);
  if (version.size() > kMaxVersionLength) {
    throw std::invalid_argument("version exceeds 64 characters");
  }
  return registry::version::Version::ParseOrThrow(version).str();
}

} // namespace registry::model
