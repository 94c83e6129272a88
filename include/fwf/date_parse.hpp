#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "fwf/value.hpp"

namespace fwf {

// Fast parse of a limited ISO-8601 subset: returns epoch millis on success.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

// Permissive parse for the date spellings found in SAS exports:
//   YYYY-MM-DD, YYYY/MM/DD, ISO date-time, YYYYMMDD, MM/DD/YYYY,
//   DDMONYYYY, DD-MON-YYYY, "Mon DD, YYYY".
// Input is expected to be trimmed.
std::optional<Date> parse_date(std::string_view s);

// Calendar helpers
bool is_leap_year(int y) noexcept;
int days_in_month(int y, int m) noexcept;

}
