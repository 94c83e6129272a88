#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "fwf/value.hpp"

namespace fwf {

// Sink for decoded rows (the tabular writer side of a pipeline).
class Collector {
public:
  virtual ~Collector() = default;
  virtual void write_header(const std::vector<std::string>& names) = 0;
  virtual void write_row(const Record& row) = 0;
  virtual void flush() {}
};

// CSV to any ostream. Fields are quoted only when they contain the
// delimiter, a quote or a line break. Keyed rows are written in header order.
class CsvWriter : public Collector {
public:
  explicit CsvWriter(std::ostream& out, char delimiter = ',');

  void write_header(const std::vector<std::string>& names) override;
  void write_row(const Record& row) override;
  void flush() override;

  std::size_t rows_written() const noexcept { return rows_; }

private:
  void write_field(const std::string& s);

  std::ostream& out_;
  char delim_;
  std::vector<std::string> header_;
  std::size_t rows_ = 0;
};

// Keeps every row in memory.
class ListCollector : public Collector {
public:
  void write_header(const std::vector<std::string>& names) override { header_ = names; }
  void write_row(const Record& row) override { rows_.push_back(row); }

  const std::vector<std::string>& header() const noexcept { return header_; }
  const std::vector<Record>& rows() const noexcept { return rows_; }

private:
  std::vector<std::string> header_;
  std::vector<Record> rows_;
};

}
