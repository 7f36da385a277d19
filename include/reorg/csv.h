#pragma once

#include <optional>
#include <string>
#include <vector>

namespace reorg {

// Quotes a field when it contains a comma, a quote or a line break.
std::string EscapeCsvField(const std::string &value);
std::string JoinCsvRow(const std::vector<std::string> &fields);

// Splits one RFC 4180 line. Returns nullopt when a quoted field is not
// terminated before the end of the line.
std::optional<std::vector<std::string>> SplitCsvLine(const std::string &line);

} // namespace reorg
