#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fwf {

// UTC instant in epoch milliseconds. has_time is false for date-only input.
struct Date {
  std::int64_t epoch_ms = 0;
  bool has_time = false;

  bool operator==(const Date& o) const noexcept {
    return epoch_ms == o.epoch_ms && has_time == o.has_time;
  }
  bool operator!=(const Date& o) const noexcept { return !(*this == o); }
};

// monostate is SQL-style null (blank numeric/date field).
using Value = std::variant<std::monostate, std::int64_t, double, Date, std::string>;

inline bool is_null(const Value& v) noexcept { return std::holds_alternative<std::monostate>(v); }

// Text rendering used by CSV output and log lines. Null renders empty,
// dates as ISO-8601.
std::string to_string(const Value& v);
std::string to_string(const Date& d);

using Positional = std::vector<Value>;
using Keyed      = std::unordered_map<std::string, Value>;
using Record     = std::variant<Positional, Keyed>;

}
