#include "fwf/file_layout.hpp"
#include "fwf/log_sink.hpp"
#include "fwf/record_reader.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;
static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static fs::path scratch(const std::string& name) {
  fs::path dir = fs::temp_directory_path() / "fwf-record-reader-test";
  fs::create_directories(dir);
  return dir / name;
}

static void write_bytes(const fs::path& p, const std::string& bytes) {
  std::ofstream out(p, std::ios::binary);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

static std::string ljust(std::string s, size_t n) { s.resize(n, ' '); return s; }
static std::string rjust(const std::string& s, size_t n) {
  return s.size() >= n ? s.substr(0, n) : std::string(n - s.size(), ' ') + s;
}

static fwf::FileLayout hello_layout(const fs::path& p) {
  std::vector<fwf::ColumnSpec> cols;
  cols.push_back(fwf::ColumnSpec::make(0, "n", fwf::ColumnType::Numeric, 0, 5));
  cols.push_back(fwf::ColumnSpec::make(1, "s", fwf::ColumnType::Text, 5, 11));
  return fwf::FileLayout(p.string(), 16, std::move(cols));
}

static std::vector<std::string> drain(fwf::RecordReader& r) {
  std::vector<std::string> rows;
  r.for_each_record([&](const fwf::Record& rec){
    std::string line;
    for (const auto& v : std::get<fwf::Positional>(rec)) { line += fwf::to_string(v); line += '|'; }
    rows.push_back(line);
  });
  return rows;
}

static void test_hello_world() {
  auto p = scratch("hello.fwf");
  write_bytes(p, "  123Hello World\n");
  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);

  fwf::Record rec;
  check(r.read_next(rec), "hello: first record");
  const auto& row = std::get<fwf::Positional>(rec);
  check(row.size() == 2, "hello: two values");
  check(std::get<std::int64_t>(row[0]) == 123, "hello: numeric 123");
  check(std::get<std::string>(row[1]) == "Hello World", "hello: text stripped");
  check(!r.read_next(rec), "hello: exhausted after one record");
  check(r.state() == fwf::RecordReader::State::Exhausted, "hello: state Exhausted");
  check(r.terminator_width() == 1, "hello: LF terminator");
  check(r.good_lines() == 1 && r.bad_lines() == 0, "hello: counters");
  check(r.bytes_read() == 17, "hello: bytes read");
}

static void test_terminators_and_chunks() {
  const std::vector<std::string> terms = {"", "\n", "\r\n"};
  for (const auto& term : terms) {
    for (std::size_t chunk : {std::size_t{1}, std::size_t{2}, std::size_t{3}, std::size_t{1000}}) {
      auto p = scratch("term" + std::to_string(term.size()) + ".fwf");
      std::string body;
      for (int i = 1; i <= 7; ++i) body += rjust(std::to_string(i), 5) + ljust("row " + std::to_string(i), 11) + term;
      write_bytes(p, body);

      auto layout = hello_layout(p);
      fwf::MemorySink log;
      fwf::RecordReader::Config cfg; cfg.log = &log; cfg.chunk_records = chunk;
      fwf::RecordReader r(layout, cfg);
      auto rows = drain(r);

      const std::string tag = "term=" + std::to_string(term.size()) + " chunk=" + std::to_string(chunk);
      check(r.terminator_width() == static_cast<int>(term.size()), tag + ": terminator width");
      check(r.record_stride() == 16 + static_cast<std::int64_t>(term.size()), tag + ": stride");
      check(rows.size() == 7, tag + ": 7 records, got " + std::to_string(rows.size()));
      check(r.bytes_read() == body.size(), tag + ": every byte consumed");
      if (rows.size() == 7) {
        check(rows[0] == "1|row 1|", tag + ": first row " + rows[0]);
        check(rows[6] == "7|row 7|", tag + ": last row " + rows[6]);
      }
      check(log.count(fwf::LogLevel::Warn) == 0, tag + ": no warnings");
    }
  }
}

static void test_last_record_without_terminator() {
  auto p = scratch("noterm_last.fwf");
  write_bytes(p, "    1first      \r\n    2second     ");
  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);
  auto rows = drain(r);
  check(r.terminator_width() == 2, "noterm_last: CRLF");
  check(rows.size() == 2 && rows[1] == "2|second|", "noterm_last: both records read");
}

static void test_partial_trailing_record() {
  auto p = scratch("partial.fwf");
  std::string body;
  for (int i = 1; i <= 3; ++i) body += rjust(std::to_string(i), 5) + ljust("ok", 11) + "\n";
  body += "   99Hel";
  write_bytes(p, body);

  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log; cfg.chunk_records = 2;
  fwf::RecordReader r(layout, cfg);
  auto rows = drain(r);
  check(rows.size() == 3, "partial: only complete records emitted");
  check(r.good_lines() == 3 && r.bad_lines() == 0, "partial: counters");
  bool warned = false;
  for (const auto& l : log.lines()) if (l.find("partial record") != std::string::npos) warned = true;
  check(warned, "partial: trailing fragment logged");
}

static fwf::FileLayout mixed_layout(const fs::path& p) {
  std::vector<fwf::ColumnSpec> cols;
  cols.push_back(fwf::ColumnSpec::make(0, "n", fwf::ColumnType::Numeric, 0, 5));
  cols.push_back(fwf::ColumnSpec::make(1, "d", fwf::ColumnType::Date, 5, 10));
  cols.push_back(fwf::ColumnSpec::make(2, "s", fwf::ColumnType::Text, 15, 5));
  return fwf::FileLayout(p.string(), 20, std::move(cols));
}

static void test_bad_date_falls_back() {
  auto p = scratch("baddate.fwf");
  write_bytes(p, "    12020-13-45abc  \n"
                 "    22020-01-15def  \n"
                 "               ghi  \n");
  auto layout = mixed_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);

  fwf::Record rec;
  check(r.read_next(rec), "baddate: record survives one failure");
  const auto row1 = std::get<fwf::Positional>(rec);
  check(r.bad_fields() == 1, "baddate: one bad field");
  check(r.good_lines() == 1 && r.bad_lines() == 0, "baddate: still a good line");
  check(std::holds_alternative<std::string>(row1[1]) && std::get<std::string>(row1[1]) == "2020-13-45",
        "baddate: raw trimmed fallback");
  check(log.count(fwf::LogLevel::Warn) == 1, "baddate: failure logged");
  bool named = false;
  for (const auto& l : log.lines()) if (l.find("1: d[1]") != std::string::npos) named = true;
  check(named, "baddate: log names record, column and ordinal");

  check(r.read_next(rec), "baddate: second record");
  const auto row2 = std::get<fwf::Positional>(rec);
  check(std::holds_alternative<fwf::Date>(row2[1]), "baddate: valid date decoded");
  check(fwf::to_string(row2[1]) == "2020-01-15", "baddate: ISO rendering");

  check(r.read_next(rec), "baddate: third record");
  const auto row3 = std::get<fwf::Positional>(rec);
  check(fwf::is_null(row3[0]), "blank numeric -> null");
  check(fwf::is_null(row3[1]), "blank date -> null");
  check(std::get<std::string>(row3[2]) == "ghi", "text kept");
  check(r.bad_fields() == 1, "blank fields are not failures");
}

static void test_too_many_failures_drops_record() {
  auto p = scratch("structural.fwf");
  std::vector<fwf::ColumnSpec> cols;
  for (int i = 0; i < 4; ++i)
    cols.push_back(fwf::ColumnSpec::make(i, "c" + std::to_string(i), fwf::ColumnType::Numeric, i * 5, 5));
  cols.push_back(fwf::ColumnSpec::make(4, "name", fwf::ColumnType::Text, 20, 5));
  fwf::FileLayout layout(p.string(), 25, std::move(cols));

  write_bytes(p, "    1    2    3    4aaaaa\n"
                 "  abc  def  ghi  jklbbbbb\n"
                 "    5    6    7    8ccccc\n");

  fwf::MemorySink log;
  std::vector<std::uint64_t> hook_lines;
  std::int64_t hook_pos = -1;
  fwf::RecordReader::Config cfg;
  cfg.log = &log;
  cfg.on_parse_failure = [&](const fwf::StructuralParseError& e, std::uint64_t line){
    hook_lines.push_back(line);
    hook_pos = e.pos();
  };
  fwf::RecordReader r(layout, cfg);
  auto rows = drain(r);

  check(rows.size() == 2, "structural: bad record skipped");
  check(r.good_lines() == 2, "structural: good lines unchanged by bad record");
  check(r.bad_lines() == 1, "structural: one bad line");
  check(hook_lines.size() == 1 && hook_lines[0] == 2, "structural: hook called for line 2");
  check(hook_pos == 15, "structural: offset of the failing column");
  check(rows.size() == 2 && rows[1] == "5|6|7|8|ccccc|", "structural: iteration continues");
  check(log.count(fwf::LogLevel::Error) >= 1, "structural: error logged");
}

static void test_three_failures_tolerated() {
  auto p = scratch("three.fwf");
  std::vector<fwf::ColumnSpec> cols;
  for (int i = 0; i < 4; ++i)
    cols.push_back(fwf::ColumnSpec::make(i, "c" + std::to_string(i), fwf::ColumnType::Numeric, i * 5, 5));
  fwf::FileLayout layout(p.string(), 20, std::move(cols));
  write_bytes(p, "  abc  def  ghi    4\n");

  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);
  fwf::Record rec;
  check(r.read_next(rec), "three failures: record kept");
  check(r.bad_fields() == 3 && r.bad_lines() == 0, "three failures: counters");
  check(std::get<std::int64_t>(std::get<fwf::Positional>(rec)[3]) == 4, "three failures: good field decoded");
}

static void test_keyed_shape() {
  auto p = scratch("keyed.fwf");
  write_bytes(p, "  123Hello World\n   -7Bye        \n");
  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log; cfg.shape = fwf::RecordReader::Shape::Keyed;
  fwf::RecordReader r(layout, cfg);

  fwf::Record rec;
  check(r.read_next(rec), "keyed: first");
  const auto& m = std::get<fwf::Keyed>(rec);
  check(m.size() == 2, "keyed: two keys");
  check(std::get<std::int64_t>(m.at("n")) == 123, "keyed: n");
  check(std::get<std::string>(m.at("s")) == "Hello World", "keyed: s");
  check(r.read_next(rec), "keyed: second");
  check(std::get<std::int64_t>(std::get<fwf::Keyed>(rec).at("n")) == -7, "keyed: negative");
  check(r.column_names() == std::vector<std::string>({"n", "s"}), "keyed: column names");
}

static void test_reopen_is_idempotent() {
  auto p = scratch("reopen.fwf");
  write_bytes(p, "    12020-01-01a    \n"
                 "    2xxxxxxxxxxb    \n"
                 "    32021-06-30c    \n");
  auto layout = mixed_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log; cfg.chunk_records = 2;
  fwf::RecordReader r(layout, cfg);

  r.open();
  auto first = drain(r);
  auto g1 = r.good_lines(), b1 = r.bad_lines(), f1 = r.bad_fields();
  r.close();
  check(r.state() == fwf::RecordReader::State::Closed, "reopen: closed");
  fwf::Record dummy;
  check(!r.read_next(dummy), "reopen: closed reader yields nothing");

  r.open();
  auto second = drain(r);
  check(first == second, "reopen: identical records");
  check(r.good_lines() == g1 && r.bad_lines() == b1 && r.bad_fields() == f1, "reopen: identical counters");
  check(first.size() == 3 && f1 == 1, "reopen: expected content");
}

static std::size_t open_fd_count() {
  std::size_t n = 0;
  std::error_code ec;
  for (fs::directory_iterator it("/proc/self/fd", ec), end; !ec && it != end; it.increment(ec)) ++n;
  return n;
}

static void test_reopen_after_exhaustion() {
  auto p = scratch("reopen-exhausted.fwf");
  write_bytes(p, "    12020-01-01a    \n"
                 "    2xxxxxxxxxxb    \n"
                 "    32021-06-30c    \n");
  auto layout = mixed_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log; cfg.chunk_records = 2;
  fwf::RecordReader r(layout, cfg);

  auto first = drain(r);
  check(r.state() == fwf::RecordReader::State::Exhausted, "reopen-exhausted: exhausted");
  auto g1 = r.good_lines(), b1 = r.bad_lines(), f1 = r.bad_fields();
  const std::size_t fds = open_fd_count();

  for (int i = 0; i < 20; ++i) {
    r.open();
    auto again = drain(r);
    check(again == first, "reopen-exhausted: identical records");
    check(r.good_lines() == g1 && r.bad_lines() == b1 && r.bad_fields() == f1,
          "reopen-exhausted: identical counters");
  }
  check(open_fd_count() == fds, "reopen-exhausted: no descriptor growth");
  r.close();
  check(open_fd_count() < fds, "reopen-exhausted: close releases the handle");
}

static void test_open_scope() {
  auto p = scratch("scope.fwf");
  write_bytes(p, "  123Hello World\n");
  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);
  {
    fwf::OpenScope scope(r);
    check(r.is_open(), "scope: open inside");
    fwf::Record rec;
    check(scope.reader().read_next(rec), "scope: read through guard");
  }
  check(r.state() == fwf::RecordReader::State::Closed, "scope: closed on exit");

  bool threw = false;
  try {
    fwf::OpenScope scope(r);
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  check(threw && r.state() == fwf::RecordReader::State::Closed, "scope: closed on exception");
}

static void test_missing_file() {
  auto p = scratch("does-not-exist.fwf");
  fs::remove(p);
  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);
  bool threw = false;
  try { r.open(); } catch (const fwf::IoError& e) { threw = e.error_code() != 0; }
  check(threw, "missing: IoError with errno");
  check(r.state() == fwf::RecordReader::State::Unopened, "missing: state unchanged");
}

static void test_empty_file() {
  auto p = scratch("empty.fwf");
  write_bytes(p, "");
  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);
  fwf::Record rec;
  check(!r.read_next(rec), "empty: no records");
  check(r.terminator_width() == 0, "empty: width 0");
  check(r.good_lines() == 0 && r.bad_lines() == 0, "empty: counters");
}

static void test_round_trip() {
  auto p = scratch("roundtrip.fwf");
  std::vector<fwf::ColumnSpec> cols;
  cols.push_back(fwf::ColumnSpec::make(0, "id", fwf::ColumnType::Numeric, 0, 6));
  cols.push_back(fwf::ColumnSpec::make(1, "amount", fwf::ColumnType::Numeric, 6, 8, 2));
  cols.push_back(fwf::ColumnSpec::make(2, "born", fwf::ColumnType::Date, 14, 9));
  cols.push_back(fwf::ColumnSpec::make(3, "name", fwf::ColumnType::Text, 23, 12));
  fwf::FileLayout layout(p.string(), 35, std::move(cols));

  struct Row { std::int64_t id; std::string amount; double expect; std::string born; std::string iso; std::string name; };
  const std::vector<Row> rows = {
    {1, "12345",   123.45, "01JAN2000", "2000-01-01", "Ada"},
    {-42, "7.5",   7.5,    "29FEB2016", "2016-02-29", "Grace Hopper"},
    {987654, "-250", -2.5, "31DEC1999", "1999-12-31", "Z"},
  };
  std::string body;
  for (const auto& r : rows)
    body += rjust(std::to_string(r.id), 6) + rjust(r.amount, 8) + ljust(r.born, 9) + ljust(r.name, 12) + "\r\n";
  write_bytes(p, body);

  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);
  std::size_t i = 0;
  fwf::Record rec;
  while (r.read_next(rec)) {
    const auto& v = std::get<fwf::Positional>(rec);
    const Row& e = rows[i];
    const std::string tag = "roundtrip row " + std::to_string(i);
    check(std::get<std::int64_t>(v[0]) == e.id, tag + ": id");
    check(std::fabs(std::get<double>(v[1]) - e.expect) < 1e-9, tag + ": amount");
    check(fwf::to_string(v[2]) == e.iso, tag + ": date " + fwf::to_string(v[2]));
    check(std::get<std::string>(v[3]) == e.name, tag + ": name");
    ++i;
  }
  check(i == rows.size(), "roundtrip: all rows");
  check(r.bad_fields() == 0, "roundtrip: no failures");
}

static void test_invalid_utf8_is_a_field_failure() {
  auto p = scratch("utf8.fwf");
  write_bytes(p, std::string("    1\xC3\x28 bad     \n") + "    2caf\xC3\xA9      \n");
  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);
  auto rows = drain(r);
  check(rows.size() == 2, "utf8: both records kept");
  check(r.bad_fields() == 1, "utf8: invalid bytes counted");
  check(rows.size() == 2 && rows[1] == "2|caf\xC3\xA9|", "utf8: multibyte text decoded");
}

static void test_size_mismatch_is_only_a_warning() {
  auto p = scratch("size.fwf");
  write_bytes(p, "  123Hello World\n");
  std::vector<fwf::ColumnSpec> cols;
  cols.push_back(fwf::ColumnSpec::make(0, "n", fwf::ColumnType::Numeric, 0, 5));
  fwf::FileLayout layout(p.string(), 16, std::move(cols), 5, 1000);

  fwf::MemorySink log;
  fwf::RecordReader::Config cfg; cfg.log = &log;
  fwf::RecordReader r(layout, cfg);
  auto rows = drain(r);
  check(rows.size() == 1, "size: file still read");
  bool size_warn = false, rows_warn = false;
  for (const auto& l : log.lines()) {
    if (l.find("Size mismatch") != std::string::npos) size_warn = true;
    if (l.find("Row count mismatch") != std::string::npos) rows_warn = true;
  }
  check(size_warn, "size: mismatch warned");
  check(rows_warn, "size: row count warned");
}

static void test_many_records_small_chunks() {
  auto p = scratch("many.fwf");
  std::string body;
  for (int i = 0; i < 1000; ++i) body += rjust(std::to_string(i), 5) + ljust("x" + std::to_string(i % 97), 11) + "\n";
  write_bytes(p, body);
  auto layout = hello_layout(p);
  fwf::MemorySink log;
  fwf::MetricsRegistry metrics;
  fwf::RecordReader::Config cfg; cfg.log = &log; cfg.chunk_records = 7; cfg.metrics = &metrics;
  fwf::RecordReader r(layout, cfg);

  std::int64_t expect = 0;
  bool in_order = true;
  fwf::Record rec;
  while (r.read_next(rec)) {
    if (std::get<std::int64_t>(std::get<fwf::Positional>(rec)[0]) != expect) in_order = false;
    ++expect;
  }
  check(expect == 1000 && in_order, "many: 1000 records in order");
  check(metrics.rows() == 1000, "many: metrics rows");
  check(r.line() == 1000, "many: line counter");
}

int main() {
  test_hello_world();
  test_terminators_and_chunks();
  test_last_record_without_terminator();
  test_partial_trailing_record();
  test_bad_date_falls_back();
  test_too_many_failures_drops_record();
  test_three_failures_tolerated();
  test_keyed_shape();
  test_reopen_is_idempotent();
  test_reopen_after_exhaustion();
  test_open_scope();
  test_missing_file();
  test_empty_file();
  test_round_trip();
  test_invalid_utf8_is_a_field_failure();
  test_size_mismatch_is_only_a_warning();
  test_many_records_small_chunks();

  if (failures) { std::cerr << "[FAIL] record_reader: " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] record_reader\n";
  return 0;
}
