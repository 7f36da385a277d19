#include <reorg/name_normalizer.h>

#include <algorithm>

namespace reorg {
namespace {

bool IsAsciiSpace(char character) {
  return character == ' ' || character == '\t' || character == '\n' ||
         character == '\r' || character == '\f' || character == '\v';
}

bool IsAllowed(char character) {
  return (character >= 'a' && character <= 'z') ||
         (character >= 'A' && character <= 'Z') ||
         (character >= '0' && character <= '9') || character == '.' ||
         character == '_' || character == '-';
}

char LowerAscii(char character) {
  if (character >= 'A' && character <= 'Z') {
    return static_cast<char>(character - 'A' + 'a');
  }
  return character;
}

} // namespace

std::string Normalize(std::string_view label) {
  if (label.empty() || EqualsIgnoreCase(label, "unknown")) {
    return kUnknownLabel;
  }

  // Whitespace runs and disallowed bytes both become '_', and '_' runs
  // collapse, so a single pass covers the first three rewriting steps.
  std::string slug;
  slug.reserve(label.size());
  for (const auto character : label) {
    const char mapped =
        IsAsciiSpace(character) || !IsAllowed(character) ? '_' : character;
    if (mapped == '_' && !slug.empty() && slug.back() == '_') {
      continue;
    }
    slug.push_back(LowerAscii(mapped));
  }

  const auto first = slug.find_first_not_of('_');
  if (first == std::string::npos) {
    return kUnknownLabel;
  }
  const auto last = slug.find_last_not_of('_');
  slug = slug.substr(first, last - first + 1);

  if (slug.find_first_not_of('.') == std::string::npos) {
    // "." and ".." would address the current or parent directory.
    return kUnknownLabel;
  }
  return slug;
}

std::string Trim(std::string value) {
  const auto is_space = [](char ch) { return IsAsciiSpace(ch); };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), LowerAscii);
  return value;
}

bool EqualsIgnoreCase(std::string_view left, std::string_view right) {
  return left.size() == right.size() &&
         std::equal(left.begin(), left.end(), right.begin(),
                    [](char a, char b) { return LowerAscii(a) == LowerAscii(b); });
}

bool IsPlaceholder(std::string_view value) {
  return value.empty() || EqualsIgnoreCase(value, "nan");
}

} // namespace reorg
