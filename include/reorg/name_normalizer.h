#pragma once

#include <string>
#include <string_view>

namespace reorg {

inline constexpr char kUnknownLabel[] = "unknown";

// Deterministic, locale-independent slug of a free-text label. The result only
// contains [a-z0-9._-], never starts or ends with '_', has no "__" run and is
// never empty. Normalize(Normalize(x)) == Normalize(x).
std::string Normalize(std::string_view label);

std::string Trim(std::string value);
std::string ToLowerAscii(std::string value);
bool EqualsIgnoreCase(std::string_view left, std::string_view right);

// True for "", "nan" and any case variant of them.
bool IsPlaceholder(std::string_view value);

} // namespace reorg
