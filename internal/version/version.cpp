#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace registry::version {

namespace {

constexpr std::size_t kMaxNumericDigits = 18;

constexpr std::string_view kSuffixTags[] = {"a", "alpha", "b", "beta", "c", "rc", "pre", "preview", "dev"};

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool IsIdentChar(char c) {
  return IsDigit(c) || IsAlpha(c) || c == '-';
}

bool IsNumeric(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), IsDigit);
}

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Dot separated identifiers; false on empty or illegal identifiers.
bool SplitIdentifiers(std::string_view s, std::vector<std::string>* out) {
  if (s.empty()) return false;
  std::size_t start = 0;
  while (true) {
    auto dot   = s.find('.', start);
    auto ident = s.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (ident.empty() || !std::all_of(ident.begin(), ident.end(), IsIdentChar)) return false;
    out->emplace_back(ident);
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  return true;
}

bool ParseNumber(std::string_view s, std::size_t* pos, uint64_t* value) {
  std::size_t begin = *pos;
  while (*pos < s.size() && IsDigit(s[*pos])) ++*pos;
  const std::size_t len = *pos - begin;
  if (len == 0 || len > kMaxNumericDigits) return false;
  *value = std::stoull(std::string(s.substr(begin, len)));
  return true;
}

// PEP 440 style suffix: [.]letters[.]digits?  ->  {letters, digits}
bool ParseSuffix(std::string_view s, std::vector<std::string>* out) {
  std::size_t pos = 0;
  if (pos < s.size() && (s[pos] == '.' || s[pos] == '_')) ++pos;

  std::size_t letters_begin = pos;
  while (pos < s.size() && IsAlpha(s[pos])) ++pos;
  if (pos == letters_begin) return false;

  std::string tag(s.substr(letters_begin, pos - letters_begin));
  std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (std::find(std::begin(kSuffixTags), std::end(kSuffixTags), tag) == std::end(kSuffixTags)) return false;
  out->push_back(std::move(tag));

  if (pos < s.size() && (s[pos] == '.' || s[pos] == '_' || s[pos] == '-')) ++pos;
  if (pos == s.size()) return s.back() != '.' && s.back() != '_' && s.back() != '-';

  std::size_t digits_begin = pos;
  while (pos < s.size() && IsDigit(s[pos])) ++pos;
  if (pos != s.size() || pos - digits_begin > kMaxNumericDigits) return false;

  out->emplace_back(s.substr(digits_begin));
  return true;
}

int CompareIdentifier(const std::string& a, const std::string& b) {
  const bool an = IsNumeric(a);
  const bool bn = IsNumeric(b);
  if (an && bn) {
    // Numeric compare without overflow: strip leading zeros, then length.
    auto strip = [](const std::string& s) {
      auto nz = s.find_first_not_of('0');
      return nz == std::string::npos ? std::string("0") : s.substr(nz);
    };
    const auto sa = strip(a);
    const auto sb = strip(b);
    if (sa.size() != sb.size()) return sa.size() < sb.size() ? -1 : 1;
    return sa.compare(sb) < 0 ? -1 : (sa == sb ? 0 : 1);
  }
  if (an) return -1;
  if (bn) return 1;
  const int c = a.compare(b);
  return c < 0 ? -1 : (c == 0 ? 0 : 1);
}

} // namespace

std::optional<Version> Version::Parse(std::string_view text) {
  text = Trim(text);
  if (text.empty()) return std::nullopt;

  std::string_view s = text;
  if (s.size() > 1 && (s[0] == 'v' || s[0] == 'V') && IsDigit(s[1])) s.remove_prefix(1);

  Version v;
  v.text_ = std::string(s);

  // build metadata
  if (auto plus = s.find('+'); plus != std::string_view::npos) {
    std::vector<std::string> build_ids;
    if (!SplitIdentifiers(s.substr(plus + 1), &build_ids)) return std::nullopt;
    v.build_ = std::string(s.substr(plus + 1));
    s        = s.substr(0, plus);
  }

  // release
  std::size_t pos = 0;
  uint64_t    component;
  if (!ParseNumber(s, &pos, &component)) return std::nullopt;
  v.release_.push_back(component);
  while (pos + 1 < s.size() && s[pos] == '.' && IsDigit(s[pos + 1])) {
    ++pos;
    if (!ParseNumber(s, &pos, &component)) return std::nullopt;
    v.release_.push_back(component);
  }

  // pre-release
  auto rest = s.substr(pos);
  if (rest.empty()) return v;

  if (rest[0] == '-') {
    if (!SplitIdentifiers(rest.substr(1), &v.prerelease_)) return std::nullopt;
    return v;
  }

  if (!ParseSuffix(rest, &v.prerelease_)) return std::nullopt;
  return v;
}

Version Version::ParseOrThrow(std::string_view text) {
  auto parsed = Parse(text);
  if (!parsed) {
    throw std::invalid_argument("invalid version: '" + std::string(text) + "'");
  }
  return std::move(*parsed);
}

Version Version::FromRelease(std::vector<uint64_t> release) {
  if (release.empty()) {
    throw std::invalid_argument("version release must have at least one component");
  }
  Version v;
  for (std::size_t i = 0; i < release.size(); ++i) {
    if (i) v.text_ += '.';
    v.text_ += std::to_string(release[i]);
  }
  v.release_ = std::move(release);
  return v;
}

int Version::ComparePrecedence(const Version& a, const Version& b) {
  const std::size_t n = std::max(a.release_.size(), b.release_.size());
  for (std::size_t i = 0; i < n; ++i) {
    const uint64_t ra = i < a.release_.size() ? a.release_[i] : 0;
    const uint64_t rb = i < b.release_.size() ? b.release_[i] : 0;
    if (ra != rb) return ra < rb ? -1 : 1;
  }

  if (a.prerelease_.empty() != b.prerelease_.empty()) {
    return a.prerelease_.empty() ? 1 : -1;
  }

  const std::size_t m = std::min(a.prerelease_.size(), b.prerelease_.size());
  for (std::size_t i = 0; i < m; ++i) {
    if (int c = CompareIdentifier(a.prerelease_[i], b.prerelease_[i]); c != 0) return c;
  }
  if (a.prerelease_.size() != b.prerelease_.size()) {
    return a.prerelease_.size() < b.prerelease_.size() ? -1 : 1;
  }
  return 0;
}

bool operator<(const Version& a, const Version& b) {
  if (int c = Version::ComparePrecedence(a, b); c != 0) return c < 0;
  return a.text_ < b.text_;
}

void SortDescending(std::vector<Version>* versions) {
  std::sort(versions->begin(), versions->end(), [](const Version& a, const Version& b) { return b < a; });
}

} // namespace registry::version
