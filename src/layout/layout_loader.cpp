#include "fwf/layout_loader.hpp"
#include "fwf/errors.hpp"

#include <simdjson.h>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fwf {

namespace {

std::optional<std::int64_t> opt_int(simdjson::ondemand::object& obj, std::string_view key) {
  std::int64_t v = 0;
  auto err = obj[key].get_int64().get(v);
  if (err == simdjson::NO_SUCH_FIELD) return std::nullopt;
  if (err) throw InvalidSpecError("field '" + std::string(key) + "': " + simdjson::error_message(err));
  return v;
}

std::int64_t req_int(simdjson::ondemand::object& obj, std::string_view key, const std::string& where) {
  auto v = opt_int(obj, key);
  if (!v) throw InvalidSpecError(where + ": missing '" + std::string(key) + "'");
  return *v;
}

std::string req_string(simdjson::ondemand::object& obj, std::string_view key, const std::string& where) {
  std::string_view v;
  auto err = obj[key].get_string().get(v);
  if (err == simdjson::NO_SUCH_FIELD) throw InvalidSpecError(where + ": missing '" + std::string(key) + "'");
  if (err) throw InvalidSpecError(where + ": field '" + std::string(key) + "': " + simdjson::error_message(err));
  return std::string(v);
}

int to_int(std::int64_t v, const std::string& where, const char* what) {
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
    throw InvalidSpecError(where + ": " + what + " out of range: " + std::to_string(v));
  return static_cast<int>(v);
}

ColumnSpec parse_column(simdjson::ondemand::object& col, int index, bool one_based) {
  const std::string where = "column #" + std::to_string(index);
  auto ord = opt_int(col, "ord").value_or(index);
  std::string name = req_string(col, "name", where);
  ColumnType type = parse_column_type(req_string(col, "type", where));
  std::int64_t start = req_int(col, "start", where);
  if (one_based) start -= 1;

  std::int64_t length = 0;
  std::int64_t scale = 0;
  simdjson::ondemand::array width;
  auto werr = col["width"].get_array().get(width);
  if (werr == simdjson::SUCCESS) {
    std::vector<std::int64_t> pair;
    for (auto w : width) {
      std::int64_t x = 0;
      if (auto e = w.get_int64().get(x)) throw InvalidSpecError(where + ": width: " + simdjson::error_message(e));
      pair.push_back(x);
    }
    if (pair.empty() || pair.size() > 2) throw InvalidSpecError(where + ": width must be [length, scale]");
    length = pair[0];
    scale = pair.size() > 1 ? pair[1] : 0;
  } else if (werr == simdjson::NO_SUCH_FIELD) {
    length = req_int(col, "length", where);
    scale = opt_int(col, "scale").value_or(0);
  } else {
    throw InvalidSpecError(where + ": width: " + simdjson::error_message(werr));
  }

  return ColumnSpec::make(to_int(ord, where, "ord"), std::move(name), type, start, length,
                          to_int(scale, where, "scale"));
}

FileLayout parse_padded(const simdjson::padded_string& json, std::string data_path) {
  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  if (auto e = parser.iterate(json).get(doc)) throw InvalidSpecError(std::string("layout: ") + simdjson::error_message(e));
  simdjson::ondemand::object root;
  if (auto e = doc.get_object().get(root)) throw InvalidSpecError(std::string("layout: ") + simdjson::error_message(e));

  const std::int64_t record_length = req_int(root, "record_length", "layout");
  auto expected_rows = opt_int(root, "expected_rows");
  auto expected_size = opt_int(root, "expected_size");

  bool one_based = false;
  auto berr = root["one_based"].get_bool().get(one_based);
  if (berr && berr != simdjson::NO_SUCH_FIELD)
    throw InvalidSpecError(std::string("layout: one_based: ") + simdjson::error_message(berr));

  simdjson::ondemand::array cols;
  if (auto e = root["columns"].get_array().get(cols))
    throw InvalidSpecError(std::string("layout: columns: ") + simdjson::error_message(e));

  std::vector<ColumnSpec> columns;
  int index = 0;
  for (auto c : cols) {
    simdjson::ondemand::object col;
    if (auto e = c.get_object().get(col))
      throw InvalidSpecError("column #" + std::to_string(index) + ": " + simdjson::error_message(e));
    columns.push_back(parse_column(col, index, one_based));
    ++index;
  }

  auto as_u64 = [](std::optional<std::int64_t> v, const char* what) -> std::optional<std::uint64_t> {
    if (!v) return std::nullopt;
    if (*v < 0) throw InvalidSpecError(std::string("layout: negative ") + what);
    return static_cast<std::uint64_t>(*v);
  };

  return FileLayout(std::move(data_path), record_length, std::move(columns),
                    as_u64(expected_rows, "expected_rows"), as_u64(expected_size, "expected_size"));
}

}

FileLayout load_layout(const std::string& descriptor_path, std::string data_path) {
  simdjson::padded_string json;
  if (auto e = simdjson::padded_string::load(descriptor_path).get(json))
    throw InvalidSpecError("cannot load layout " + descriptor_path + ": " + simdjson::error_message(e));
  return parse_padded(json, std::move(data_path));
}

FileLayout parse_layout(std::string_view json_text, std::string data_path) {
  simdjson::padded_string json(json_text);
  return parse_padded(json, std::move(data_path));
}

}
