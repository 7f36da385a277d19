#pragma once

#include <reorg/logging.h>
#include <reorg/models.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reorg {

inline constexpr std::array<const char *, 4> kMetadataColumns = {
    "filename", "base_model", "model_name", "model_type"};

// Applies trimming and the "Unknown" default for placeholder values.
MetadataRecord MakeRecord(std::string filename, std::string base_model,
                          std::string model_name, std::string model_type,
                          std::size_t line = 0);

// base_model for LORA rows, model_name otherwise.
const std::string &EffectiveModel(const MetadataRecord &record);

// Pull reader over a CSV metadata source. The header is validated on
// construction; records are produced one row at a time.
class MetadataReader {
public:
  MetadataReader(std::unique_ptr<std::istream> stream, std::string source_name,
                 std::shared_ptr<Logger> logger = nullptr);

  static MetadataReader Open(const std::filesystem::path &path,
                             std::shared_ptr<Logger> logger = nullptr);

  std::optional<MetadataRecord> Next();

  std::size_t RecordsRead() const { return records_read_; }
  std::size_t MalformedRows() const { return malformed_rows_; }
  const std::string &SourceName() const { return source_name_; }

private:
  void ReadHeader();

  std::unique_ptr<std::istream> stream_;
  std::string source_name_;
  std::shared_ptr<Logger> logger_;
  std::array<std::size_t, 4> column_positions_{};
  std::size_t line_number_ = 0;
  std::size_t records_read_ = 0;
  std::size_t malformed_rows_ = 0;
};

std::vector<MetadataRecord> ReadAllRecords(MetadataReader &reader);

} // namespace reorg
