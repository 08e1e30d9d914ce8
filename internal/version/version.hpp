#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace registry::version {

/*
  Orderable version: [v]RELEASE[-PRE][+BUILD]

    RELEASE  dot separated integers            1, 1.4, 2.0.13
    PRE      semver identifiers after '-'      1.0.0-rc.1
             or a PEP 440 style suffix         1.0a1, 2.1rc2, 1.0.dev3
    BUILD    identifiers after '+', ignored for precedence

  str() is the canonical spelling: the text without a leading 'v', so
  "v1.2.3" and "1.2.3" name the same version. Trailing zero components and
  build metadata are kept, so "1.0", "1.0.0" and "1.0.0+b1" stay distinct.

  operator< is a total order: precedence first, then the canonical text, so
  two versions are equal only when their canonical strings are.
*/
class Version {
 public:
  static std::optional<Version> Parse(std::string_view text);

  // Throws std::invalid_argument with the offending text.
  static Version ParseOrThrow(std::string_view text);

  static Version FromRelease(std::vector<uint64_t> release);

  const std::string&              str() const { return text_; }
  const std::vector<uint64_t>&    release() const { return release_; }
  const std::vector<std::string>& prerelease() const { return prerelease_; }
  const std::string&              build() const { return build_; }

  bool IsPrerelease() const { return !prerelease_.empty(); }

  // <0, 0, >0 on precedence alone (build metadata and spelling ignored).
  static int ComparePrecedence(const Version& a, const Version& b);

  friend bool operator<(const Version& a, const Version& b);
  friend bool operator==(const Version& a, const Version& b) { return a.text_ == b.text_; }
  friend bool operator!=(const Version& a, const Version& b) { return !(a == b); }
  friend bool operator>(const Version& a, const Version& b) { return b < a; }

 private:
  Version() = default;

  std::string              text_;
  std::vector<uint64_t>    release_;
  std::vector<std::string> prerelease_;
  std::string              build_;
};

// Descending order, highest first.
void SortDescending(std::vector<Version>* versions);

} // namespace registry::version
