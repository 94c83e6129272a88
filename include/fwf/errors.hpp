#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace fwf {

struct FwfError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Bad layout or descriptor. Raised before any reading starts.
struct InvalidSpecError : FwfError {
  using FwfError::FwfError;
};

// Raised when a record has too many field failures; the reader catches it,
// counts the record as bad and moves on.
class StructuralParseError : public FwfError {
public:
  StructuralParseError(const std::string& msg, std::int64_t pos, std::string column)
    : FwfError(msg), pos_(pos), column_(std::move(column)) {}

  std::int64_t pos() const noexcept { return pos_; }
  const std::string& column() const noexcept { return column_; }

private:
  std::int64_t pos_;
  std::string column_;
};

// Open/read failure on the data file.
class IoError : public FwfError {
public:
  IoError(const std::string& msg, int err) : FwfError(msg), errno_(err) {}
  int error_code() const noexcept { return errno_; }

private:
  int errno_;
};

}
