#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fwf/column_spec.hpp"
#include "fwf/field_decoder.hpp"
#include "fwf/log_sink.hpp"

namespace fwf {

// Declared shape of one fixed-width file. Built from caller metadata (or a
// JSON descriptor, see layout_loader.hpp), read-only afterwards.
class FileLayout {
public:
  // Throws InvalidSpecError when record_length <= 0, there are no columns,
  // names or ordinals repeat, or a column ends past record_length.
  FileLayout(std::string path, std::int64_t record_length,
             std::vector<ColumnSpec> columns,
             std::optional<std::uint64_t> expected_rows = std::nullopt,
             std::optional<std::uint64_t> expected_size = std::nullopt);

  const std::string& path() const noexcept { return path_; }
  std::int64_t record_length() const noexcept { return record_length_; }
  const std::vector<ColumnSpec>& columns() const noexcept { return columns_; }
  const std::vector<FieldDecoder>& decoders() const noexcept { return decoders_; }
  std::size_t ncol() const noexcept { return columns_.size(); }
  std::optional<std::uint64_t> expected_rows() const noexcept { return expected_rows_; }
  std::optional<std::uint64_t> expected_size() const noexcept { return expected_size_; }

  std::vector<std::string> column_names() const;

  // Size on disk, nullopt if the file cannot be stat'ed.
  std::optional<std::uint64_t> actual_size() const;

  // Logs (never throws) when the file size disagrees with expected_size.
  // Returns false on any mismatch.
  bool validate(LogSink& log) const;

  // Same, plus a row-count check once the terminator width is known.
  bool validate(LogSink& log, int terminator_width) const;

  std::string to_string() const;

private:
  std::string path_;
  std::int64_t record_length_;
  std::vector<ColumnSpec> columns_;
  std::vector<FieldDecoder> decoders_;
  std::optional<std::uint64_t> expected_rows_;
  std::optional<std::uint64_t> expected_size_;
};

}
