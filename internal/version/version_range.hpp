#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/version/version.hpp"

namespace registry::version {

/*
  Range expression over Version.

    *  latest  (empty)            any version
    =V ==V !=V >V >=V <V <=V      comparators
    ^V  ~V  ~=V                   caret, tilde, compatible release
    1.*  1.2.x                    wildcards
    ","  or whitespace            conjunction
    "||"                          disjunction

  A pre-release only satisfies a conjunction when one of its comparators
  names a pre-release itself.
*/
class VersionRange {
 public:
  // Throws std::invalid_argument on malformed expressions.
  static VersionRange Parse(std::string_view expr);

  static VersionRange Any();

  bool Matches(const Version& v) const;

  bool IsAny() const;

  const std::string& str() const { return text_; }

 private:
  enum class Op { kEq, kNe, kGt, kGe, kLt, kLe };

  struct Comparator {
    Op      op;
    Version version;
  };

  struct Conjunction {
    std::vector<Comparator> comparators;
    bool                    allows_prerelease = false;
  };

  static void ParseTerm(std::string_view term, Conjunction* out);
  static bool Satisfies(const Comparator& c, const Version& v);

  std::string              text_;
  std::vector<Conjunction> alternatives_;
};

/*
  Highest candidate (under Version's total order) matching the range.
  Pure: no storage access.
*/
std::optional<Version> SelectHighest(const VersionRange& range, const std::vector<Version>& candidates);

/*
  True when the text names one exact version rather than a range.
*/
bool IsExactVersion(std::string_view text);

} // namespace registry::version
