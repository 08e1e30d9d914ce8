#include "version_range.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace registry::version {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool IsOperatorOnly(std::string_view token) {
  return token == "=" || token == "==" || token == "!=" || token == ">" || token == ">=" || token == "<" || token == "<=" ||
         token == "^" || token == "~" || token == "~=";
}

bool IsAnyToken(std::string_view token) {
  return token == "*" || token == "x" || token == "X" || token == "latest";
}

// Splits a conjunction on ',' and whitespace, gluing a bare operator to the
// version that follows it (">= 1.0").
std::vector<std::string> Tokenize(std::string_view conj) {
  std::vector<std::string> raw;
  std::string              current;
  for (char c : conj) {
    if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) raw.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) raw.push_back(std::move(current));

  std::vector<std::string> tokens;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (IsOperatorOnly(raw[i]) && i + 1 < raw.size()) {
      tokens.push_back(raw[i] + raw[i + 1]);
      ++i;
      continue;
    }
    tokens.push_back(raw[i]);
  }
  return tokens;
}

// "1.2.*" / "1.x" -> release prefix {1, 2} / {1}; nullopt when not a wildcard.
std::optional<std::vector<uint64_t>> WildcardPrefix(std::string_view text) {
  if (text.size() < 3) return std::nullopt;
  const char last = text.back();
  if ((last != '*' && last != 'x' && last != 'X') || text[text.size() - 2] != '.') return std::nullopt;

  auto prefix = Version::Parse(text.substr(0, text.size() - 2));
  if (!prefix || prefix->IsPrerelease() || !prefix->build().empty()) {
    throw std::invalid_argument("invalid wildcard version: '" + std::string(text) + "'");
  }
  return prefix->release();
}

Version Bump(std::vector<uint64_t> prefix) {
  prefix.back() += 1;
  return Version::FromRelease(std::move(prefix));
}

} // namespace

VersionRange VersionRange::Any() {
  VersionRange range;
  range.text_ = "*";
  range.alternatives_.emplace_back();
  return range;
}

VersionRange VersionRange::Parse(std::string_view expr) {
  VersionRange range;
  range.text_ = std::string(Trim(expr));

  std::string_view rest = range.text_;
  while (true) {
    auto bar  = rest.find("||");
    auto conj = Trim(rest.substr(0, bar));

    Conjunction conjunction;
    const auto  tokens = Tokenize(conj);
    if (tokens.empty() && (bar != std::string_view::npos || !range.alternatives_.empty())) {
      throw std::invalid_argument("empty alternative in version range: '" + range.text_ + "'");
    }
    for (const auto& token : tokens) {
      ParseTerm(token, &conjunction);
    }
    range.alternatives_.push_back(std::move(conjunction));

    if (bar == std::string_view::npos) break;
    rest = rest.substr(bar + 2);
  }

  return range;
}

void VersionRange::ParseTerm(std::string_view term, Conjunction* out) {
  if (IsAnyToken(term)) {
    return;
  }

  static constexpr std::pair<std::string_view, Op> kOps[] = {
      {"==", Op::kEq}, {"!=", Op::kNe}, {">=", Op::kGe}, {"<=", Op::kLe}, {"=", Op::kEq}, {">", Op::kGt}, {"<", Op::kLt},
  };

  auto add = [out](Op op, Version v) {
    if (v.IsPrerelease()) out->allows_prerelease = true;
    out->comparators.push_back({op, std::move(v)});
  };

  if (term.substr(0, 2) == "~=") {
    auto v = Version::ParseOrThrow(term.substr(2));
    if (v.release().size() < 2) {
      throw std::invalid_argument("compatible release '~=' needs at least two release components: '" + std::string(term) + "'");
    }
    std::vector<uint64_t> prefix(v.release().begin(), v.release().end() - 1);
    add(Op::kGe, v);
    add(Op::kLt, Bump(std::move(prefix)));
    return;
  }

  if (term.front() == '^') {
    auto v = Version::ParseOrThrow(term.substr(1));
    auto r = v.release();
    r.resize(std::max<std::size_t>(r.size(), 3), 0);
    std::vector<uint64_t> prefix;
    if (r[0] > 0) {
      prefix = {r[0]};
    } else if (r[1] > 0) {
      prefix = {0, r[1]};
    } else {
      prefix = {0, 0, r[2]};
    }
    add(Op::kGe, v);
    add(Op::kLt, Bump(std::move(prefix)));
    return;
  }

  if (term.front() == '~') {
    auto                  v = Version::ParseOrThrow(term.substr(1));
    const auto&           r = v.release();
    std::vector<uint64_t> prefix(r.begin(), r.begin() + std::min<std::size_t>(r.size(), 2));
    add(Op::kGe, v);
    add(Op::kLt, Bump(std::move(prefix)));
    return;
  }

  Op               op = Op::kEq;
  std::string_view operand = term;
  for (const auto& [token, candidate] : kOps) {
    if (term.substr(0, token.size()) == token) {
      op      = candidate;
      operand = term.substr(token.size());
      break;
    }
  }

  if (auto prefix = WildcardPrefix(operand)) {
    if (op != Op::kEq) {
      throw std::invalid_argument("wildcards are only allowed with '=' or '==': '" + std::string(term) + "'");
    }
    add(Op::kGe, Version::FromRelease(*prefix));
    add(Op::kLt, Bump(*prefix));
    return;
  }

  add(op, Version::ParseOrThrow(operand));
}

bool VersionRange::Satisfies(const Comparator& c, const Version& v) {
  const int cmp = Version::ComparePrecedence(v, c.version);
  switch (c.op) {
    case Op::kEq:
      return cmp == 0;
    case Op::kNe:
      return cmp != 0;
    case Op::kGt:
      return cmp > 0;
    case Op::kGe:
      return cmp >= 0;
    case Op::kLt:
      return cmp < 0;
    case Op::kLe:
      return cmp <= 0;
  }
  return false;
}

bool VersionRange::Matches(const Version& v) const {
  for (const auto& conjunction : alternatives_) {
    if (v.IsPrerelease() && !conjunction.allows_prerelease) {
      continue;
    }
    bool all = true;
    for (const auto& comparator : conjunction.comparators) {
      if (!Satisfies(comparator, v)) {
        all = false;
        break;
      }
    }
    if (all) return true;
  }
  return false;
}

bool VersionRange::IsAny() const {
  for (const auto& conjunction : alternatives_) {
    if (conjunction.comparators.empty()) return true;
  }
  return false;
}

std::optional<Version> SelectHighest(const VersionRange& range, const std::vector<Version>& candidates) {
  const Version* best = nullptr;
  for (const auto& candidate : candidates) {
    if (!range.Matches(candidate)) continue;
    if (!best || *best < candidate) best = &candidate;
  }
  if (!best) return std::nullopt;
  return *best;
}

bool IsExactVersion(std::string_view text) {
  return Version::Parse(text).has_value();
}

} // namespace registry::version
