#include "fwf/field_decoder.hpp"
#include "fwf/date_parse.hpp"
#include <charconv>
#include <cmath>
#include <string>
#include <string_view>
#include <fast_float/fast_float.h>

namespace fwf {

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == '\0';
}

std::string_view trim(std::string_view s) noexcept {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
  return s;
}

bool is_valid_utf8(std::string_view s) noexcept {
  size_t i = 0;
  const size_t n = s.size();
  while (i < n) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) { ++i; continue; }
    size_t extra;
    std::uint32_t cp;
    if ((c & 0xE0) == 0xC0)      { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return false;
    for (size_t k = 1; k <= extra; ++k) {
      if (i + k >= n) return false;
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += extra + 1;
  }
  return true;
}

std::optional<std::int64_t> parse_int64(std::string_view s) {
  if (s.empty()) return std::nullopt;
  if (s.front() == '+') {
    s.remove_prefix(1);
    if (s.empty() || s.front() == '-') return std::nullopt;
  }
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<Value> decode_integer(std::string_view text, int, const DecodePolicy&) {
  auto v = trim(text);
  if (v.empty()) return Value{};
  auto n = parse_int64(v);
  if (!n) return std::nullopt;
  return Value{*n};
}

// SAS w.d informat: an explicit decimal point wins, otherwise the digits
// carry an implied decimal point `scale` places from the right.
std::optional<Value> decode_scaled(std::string_view text, int scale, const DecodePolicy&) {
  auto v = trim(text);
  if (v.empty()) return Value{};
  if (v.find('.') != std::string_view::npos) {
    std::string_view body = v;
    if (body.front() == '+') body.remove_prefix(1);
    double out;
    auto [ptr, ec] = fast_float::from_chars(body.data(), body.data() + body.size(), out);
    if (ec != std::errc() || ptr != body.data() + body.size()) return std::nullopt;
    return Value{out};
  }
  auto n = parse_int64(v);
  if (!n) return std::nullopt;
  return Value{static_cast<double>(*n) / std::pow(10.0, scale)};
}

std::optional<Value> decode_date(std::string_view text, int, const DecodePolicy&) {
  auto v = trim(text);
  if (v.empty()) return Value{};
  auto d = parse_date(v);
  if (!d) return std::nullopt;
  return Value{*d};
}

std::optional<Value> decode_text(std::string_view text, int, const DecodePolicy& policy) {
  auto v = policy.trim_text ? trim(text) : text;
  return Value{std::string(v)};
}

FieldDecoder decoder_for(const ColumnSpec& column) {
  FieldDecoder d;
  d.type = column.type();
  d.scale = column.scale();
  switch (column.type()) {
    case ColumnType::Numeric: d.fn = column.scale() > 0 ? &decode_scaled : &decode_integer; break;
    case ColumnType::Date:    d.fn = &decode_date; break;
    case ColumnType::Text:    d.fn = &decode_text; break;
  }
  return d;
}

}
