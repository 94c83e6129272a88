#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "fwf/errors.hpp"
#include "fwf/file_layout.hpp"
#include "fwf/log_sink.hpp"
#include "fwf/metrics.hpp"
#include "fwf/value.hpp"

namespace fwf {

// Pull-based reader over a fixed-width file. Reads many records per physical
// read, slices each record by the layout's byte ranges and decodes the fields.
//
// Lifecycle: Unopened -> Open -> Exhausted; close() from any state.
// open() after close() starts a fresh pass with counters reset.
class RecordReader {
public:
  enum class Shape { Positional, Keyed };
  enum class State { Unopened, Open, Exhausted, Closed };

  // Called for every record dropped by a StructuralParseError.
  using FailureHook = std::function<void(const StructuralParseError&, std::uint64_t line)>;
  using RecordCallback = std::function<void(const Record&)>;

  struct Config {
    std::size_t chunk_records   = 1000;   // records per physical read
    Shape       shape           = Shape::Positional;
    bool        trim_text       = true;   // strip Text fields
    int         max_field_failures = 3;   // more than this drops the record
    LogSink*    log             = nullptr; // default_sink() when null
    MetricsRegistry* metrics    = nullptr;
    FailureHook on_parse_failure;
  };

  explicit RecordReader(const FileLayout& layout);   // uses default Config{}
  RecordReader(const FileLayout& layout, Config cfg);
  ~RecordReader();

  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;

  // Throws IoError if the file cannot be opened. Detects the terminator
  // width on first use. No-op when already open.
  void open();
  void close() noexcept;

  // Next good record. Returns false once the file is exhausted; bad records
  // are counted, reported and skipped. Opens the reader if needed.
  bool read_next(Record& out);

  // Drives read_next to the end; returns the number of records delivered.
  std::uint64_t for_each_record(const RecordCallback& cb);

  // Decodes one raw record of record_length bytes in layout order.
  // Throws StructuralParseError past max_field_failures.
  Positional decode_record(std::string_view block);

  State state() const noexcept;
  bool is_open() const noexcept { return state() == State::Open; }
  int terminator_width() const noexcept;    // -1 until detected
  std::int64_t record_stride() const noexcept;

  std::uint64_t good_lines() const noexcept;
  std::uint64_t bad_lines() const noexcept;
  std::uint64_t bad_fields() const noexcept;
  std::uint64_t line() const noexcept;
  std::uint64_t bytes_read() const noexcept;

  const FileLayout& layout() const noexcept;
  std::vector<std::string> column_names() const;

private:
  struct Impl; Impl* p_;
};

// Opens on construction, closes on scope exit.
class OpenScope {
public:
  explicit OpenScope(RecordReader& r) : r_(r) { r_.open(); }
  ~OpenScope() { r_.close(); }

  OpenScope(const OpenScope&) = delete;
  OpenScope& operator=(const OpenScope&) = delete;

  RecordReader& reader() noexcept { return r_; }

private:
  RecordReader& r_;
};

}
