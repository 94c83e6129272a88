#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "fwf/column_spec.hpp"
#include "fwf/value.hpp"

namespace fwf {

struct DecodePolicy {
  // Strip surrounding whitespace from Text fields.
  bool trim_text = true;
};

// Returns nullopt when the text cannot be coerced to the column type.
using DecodeFn = std::optional<Value> (*)(std::string_view text, int scale,
                                          const DecodePolicy& policy);

// Decoder bound to one column, resolved once when a layout is built.
struct FieldDecoder {
  ColumnType type = ColumnType::Text;
  int scale = 0;
  DecodeFn fn = nullptr;

  std::optional<Value> operator()(std::string_view text, const DecodePolicy& policy) const {
    return fn(text, scale, policy);
  }
};

FieldDecoder decoder_for(const ColumnSpec& column);

// Individual coercions (also used directly by tests and the CLI).
std::optional<Value> decode_integer(std::string_view text, int scale, const DecodePolicy& policy);
std::optional<Value> decode_scaled(std::string_view text, int scale, const DecodePolicy& policy);
std::optional<Value> decode_date(std::string_view text, int scale, const DecodePolicy& policy);
std::optional<Value> decode_text(std::string_view text, int scale, const DecodePolicy& policy);

// Helpers
std::string_view trim(std::string_view s) noexcept;
bool is_valid_utf8(std::string_view s) noexcept;
std::optional<std::int64_t> parse_int64(std::string_view s);

}
