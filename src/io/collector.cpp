#include "fwf/collector.hpp"
#include "fwf/errors.hpp"

namespace fwf {

CsvWriter::CsvWriter(std::ostream& out, char delimiter) : out_(out), delim_(delimiter) {}

void CsvWriter::write_field(const std::string& s) {
  const bool quote = s.find_first_of(std::string{delim_, '"', '\n', '\r'}) != std::string::npos;
  if (!quote) { out_ << s; return; }
  out_ << '"';
  for (char c : s) {
    if (c == '"') out_ << '"';
    out_ << c;
  }
  out_ << '"';
}

void CsvWriter::write_header(const std::vector<std::string>& names) {
  header_ = names;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i) out_ << delim_;
    write_field(names[i]);
  }
  out_ << '\n';
}

void CsvWriter::write_row(const Record& row) {
  if (const auto* pos = std::get_if<Positional>(&row)) {
    for (std::size_t i = 0; i < pos->size(); ++i) {
      if (i) out_ << delim_;
      write_field(to_string((*pos)[i]));
    }
  } else {
    const auto& keyed = std::get<Keyed>(row);
    if (header_.empty()) throw FwfError("CsvWriter: keyed rows need write_header() first");
    for (std::size_t i = 0; i < header_.size(); ++i) {
      if (i) out_ << delim_;
      auto it = keyed.find(header_[i]);
      if (it != keyed.end()) write_field(to_string(it->second));
    }
  }
  out_ << '\n';
  ++rows_;
}

void CsvWriter::flush() { out_.flush(); }

}
