#include <reorg/csv.h>

namespace reorg {

std::string EscapeCsvField(const std::string &value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) {
    return value;
  }
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const auto character : value) {
    if (character == '"') {
      escaped.push_back('"');
    }
    escaped.push_back(character);
  }
  escaped.push_back('"');
  return escaped;
}

std::string JoinCsvRow(const std::vector<std::string> &fields) {
  std::string row;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      row.push_back(',');
    }
    row.append(EscapeCsvField(fields[i]));
  }
  return row;
}

std::optional<std::vector<std::string>> SplitCsvLine(const std::string &line) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const auto character = line[i];
    if (quoted) {
      if (character == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
          continue;
        }
        quoted = false;
        continue;
      }
      current.push_back(character);
      continue;
    }
    if (character == '"') {
      quoted = true;
      continue;
    }
    if (character == ',') {
      fields.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  if (quoted) {
    return std::nullopt;
  }
  fields.push_back(current);
  return fields;
}

} // namespace reorg
