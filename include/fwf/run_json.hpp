#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fwf {

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t rows = 0;
  std::uint64_t bad_rows = 0;
  std::uint64_t bad_fields = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  // Stages and errors
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::unordered_map<std::string, std::uint64_t> errors_by_field;

  // Input metadata
  std::string filename;
  std::string layout;
  std::uint64_t file_size = 0;
  std::int64_t expected_size = -1;   // -1: not declared
  std::int64_t expected_rows = -1;
  bool size_ok = true;
  std::int64_t record_length = 0;
  int terminator_width = 0;
  std::vector<std::string> columns;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);
};

}
