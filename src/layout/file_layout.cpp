#include "fwf/file_layout.hpp"
#include "fwf/errors.hpp"
#include <filesystem>
#include <unordered_set>

namespace fwf {

FileLayout::FileLayout(std::string path, std::int64_t record_length,
                       std::vector<ColumnSpec> columns,
                       std::optional<std::uint64_t> expected_rows,
                       std::optional<std::uint64_t> expected_size)
  : path_(std::move(path)), record_length_(record_length), columns_(std::move(columns)),
    expected_rows_(expected_rows), expected_size_(expected_size) {
  if (record_length_ <= 0)
    throw InvalidSpecError("record length must be > 0, got " + std::to_string(record_length_));
  if (columns_.empty())
    throw InvalidSpecError("layout for " + path_ + " declares no columns");

  std::unordered_set<std::string> names;
  std::unordered_set<int> ords;
  decoders_.reserve(columns_.size());
  for (const auto& c : columns_) {
    if (!names.insert(c.name()).second)
      throw InvalidSpecError("duplicate column name: " + c.name());
    if (!ords.insert(c.ord()).second)
      throw InvalidSpecError("duplicate column ordinal " + std::to_string(c.ord()) + " (" + c.name() + ")");
    if (c.end() > record_length_)
      throw InvalidSpecError("column " + c.to_string() + " ends past record length " +
                             std::to_string(record_length_));
    decoders_.push_back(decoder_for(c));
  }
}

std::vector<std::string> FileLayout::column_names() const {
  std::vector<std::string> out;
  out.reserve(columns_.size());
  for (const auto& c : columns_) out.push_back(c.name());
  return out;
}

std::optional<std::uint64_t> FileLayout::actual_size() const {
  std::error_code ec;
  auto n = std::filesystem::file_size(path_, ec);
  if (ec) return std::nullopt;
  return static_cast<std::uint64_t>(n);
}

bool FileLayout::validate(LogSink& log) const {
  auto size = actual_size();
  if (!size) {
    log.warn("cannot stat " + path_);
    return false;
  }
  if (expected_size_ && *expected_size_ != *size) {
    log.warn("Size mismatch: " + path_ + ": expected: " + std::to_string(*expected_size_) +
             "; actual: " + std::to_string(*size));
    return false;
  }
  return true;
}

bool FileLayout::validate(LogSink& log, int terminator_width) const {
  bool ok = validate(log);
  if (!expected_rows_) return ok;
  auto size = actual_size();
  if (!size) return false;
  // the last record may come without its terminator
  const std::uint64_t stride = static_cast<std::uint64_t>(record_length_ + terminator_width);
  const std::uint64_t rows = (*size + static_cast<std::uint64_t>(terminator_width)) / stride;
  if (rows != *expected_rows_) {
    log.warn("Row count mismatch: " + path_ + ": expected: " + std::to_string(*expected_rows_) +
             "; actual: " + std::to_string(rows));
    return false;
  }
  return ok;
}

std::string FileLayout::to_string() const {
  std::string s = path_ + " [" + std::to_string(record_length_) + " bytes/record]:";
  for (const auto& c : columns_) { s += ' '; s += c.to_string(); }
  return s;
}

}
