#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fwf {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t rows = 0;
  std::uint64_t bad_rows = 0;
  std::uint64_t bad_fields = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  std::vector<StageTiming> stages;   // finished stages, in first-start order
  std::unordered_map<std::string, std::uint64_t> errors_by_field;
};

// Counters fed by RecordReader plus named wall-clock stages driven by the CLI.
class MetricsRegistry {
public:
  void reset();
  void add_row() noexcept { ++rows_; }
  void add_bad_row() noexcept { ++bad_rows_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }

  // A stage may be entered several times; its durations accumulate.
  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_field_error(std::string_view column);

  std::uint64_t rows() const noexcept { return rows_; }
  std::uint64_t bad_rows() const noexcept { return bad_rows_; }

  RunStats snapshot(double wall_ms) const;

private:
  using Clock = std::chrono::steady_clock;
  struct Stage {
    std::string name;
    Clock::time_point started;
    bool running = false;
    std::uint32_t runs = 0;
    std::uint64_t total_ms = 0;
  };
  Stage* find_stage(std::string_view name);

  std::uint64_t rows_{0};
  std::uint64_t bad_rows_{0};
  std::uint64_t bad_fields_{0};
  std::uint64_t bytes_{0};
  std::unordered_map<std::string, std::uint64_t> errors_by_column_;
  std::vector<Stage> stages_;
};

// Times one stage for the lifetime of the guard.
class StageScope {
public:
  StageScope(MetricsRegistry& m, std::string name) : m_(m), name_(std::move(name)) { m_.start_stage(name_); }
  ~StageScope() { m_.end_stage(name_); }
  StageScope(const StageScope&) = delete;
  StageScope& operator=(const StageScope&) = delete;
private:
  MetricsRegistry& m_;
  std::string name_;
};

}
