#include <reorg/metadata_parser.h>

#include <reorg/csv.h>
#include <reorg/errors.h>
#include <reorg/name_normalizer.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>

namespace reorg {
namespace {

constexpr const char kUnknownValue[] = "Unknown";
constexpr const char kUtf8Bom[] = "\xEF\xBB\xBF";

std::string DefaultIfPlaceholder(std::string value) {
  value = Trim(std::move(value));
  if (IsPlaceholder(value)) {
    return kUnknownValue;
  }
  return value;
}

void StripLineEnding(std::string &line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

bool IsBlank(const std::string &line) {
  return std::all_of(line.begin(), line.end(), [](char ch) {
    return ch == ' ' || ch == '\t';
  });
}

} // namespace

MetadataRecord MakeRecord(std::string filename, std::string base_model,
                          std::string model_name, std::string model_type,
                          std::size_t line) {
  MetadataRecord record;
  record.filename = Trim(std::move(filename));
  record.base_model = DefaultIfPlaceholder(std::move(base_model));
  record.model_name = DefaultIfPlaceholder(std::move(model_name));
  record.model_type = DefaultIfPlaceholder(std::move(model_type));
  record.line = line;
  return record;
}

const std::string &EffectiveModel(const MetadataRecord &record) {
  if (EqualsIgnoreCase(record.model_type, "lora")) {
    return record.base_model;
  }
  return record.model_name;
}

MetadataReader::MetadataReader(std::unique_ptr<std::istream> stream,
                               std::string source_name,
                               std::shared_ptr<Logger> logger)
    : stream_(std::move(stream)), source_name_(std::move(source_name)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!stream_ || !*stream_) {
    throw InputError("Metadata source is not readable: " + source_name_);
  }
  ReadHeader();
}

MetadataReader MetadataReader::Open(const std::filesystem::path &path,
                                    std::shared_ptr<Logger> logger) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw InputError("Metadata file not found: " + path.string());
  }
  auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*stream) {
    throw InputError("Failed to open metadata file: " + path.string());
  }
  return MetadataReader(std::move(stream), path.string(), std::move(logger));
}

void MetadataReader::ReadHeader() {
  std::string line;
  while (std::getline(*stream_, line)) {
    ++line_number_;
    StripLineEnding(line);
    if (line_number_ == 1 && line.rfind(kUtf8Bom, 0) == 0) {
      line.erase(0, 3);
    }
    if (!IsBlank(line)) {
      break;
    }
    line.clear();
  }
  if (line.empty()) {
    throw InputError("Metadata header row is missing: " + source_name_);
  }

  const auto columns = SplitCsvLine(line);
  if (!columns || columns->size() != kMetadataColumns.size()) {
    throw InputError("Metadata header must have exactly " +
                     std::to_string(kMetadataColumns.size()) +
                     " columns (filename, base_model, model_name, "
                     "model_type): " +
                     source_name_);
  }

  std::vector<std::string> names;
  names.reserve(columns->size());
  for (const auto &column : *columns) {
    names.push_back(ToLowerAscii(Trim(column)));
  }
  for (std::size_t i = 0; i < kMetadataColumns.size(); ++i) {
    const auto found =
        std::find(names.begin(), names.end(), kMetadataColumns[i]);
    if (found == names.end()) {
      throw InputError(std::string("Metadata header is missing column '") +
                       kMetadataColumns[i] + "': " + source_name_);
    }
    column_positions_[i] =
        static_cast<std::size_t>(std::distance(names.begin(), found));
  }
}

std::optional<MetadataRecord> MetadataReader::Next() {
  std::string line;
  while (std::getline(*stream_, line)) {
    ++line_number_;
    StripLineEnding(line);
    if (IsBlank(line)) {
      continue;
    }

    const auto fields = SplitCsvLine(line);
    if (!fields || fields->size() != kMetadataColumns.size()) {
      ++malformed_rows_;
      logger_->Log(LogLevel::kDebug, "metadata.row.malformed",
                   {{"source", source_name_},
                    {"line", std::to_string(line_number_)},
                    {"columns",
                     fields ? std::to_string(fields->size()) : "unterminated"}});
      continue;
    }

    auto record = MakeRecord((*fields)[column_positions_[0]],
                             (*fields)[column_positions_[1]],
                             (*fields)[column_positions_[2]],
                             (*fields)[column_positions_[3]], line_number_);
    if (record.filename.empty()) {
      ++malformed_rows_;
      logger_->Log(LogLevel::kDebug, "metadata.row.empty_filename",
                   {{"source", source_name_},
                    {"line", std::to_string(line_number_)}});
      continue;
    }

    ++records_read_;
    return record;
  }
  return std::nullopt;
}

std::vector<MetadataRecord> ReadAllRecords(MetadataReader &reader) {
  std::vector<MetadataRecord> records;
  while (auto record = reader.Next()) {
    records.push_back(std::move(*record));
  }
  return records;
}

} // namespace reorg
