#include "fwf/metrics.hpp"

namespace fwf {

static double per_second(double amount, double wall_ms) {
  return wall_ms > 0.0 ? amount * 1000.0 / wall_ms : 0.0;
}

void MetricsRegistry::reset() {
  *this = MetricsRegistry{};
}

MetricsRegistry::Stage* MetricsRegistry::find_stage(std::string_view name) {
  for (auto& s : stages_) if (s.name == name) return &s;
  return nullptr;
}

void MetricsRegistry::start_stage(std::string_view name) {
  Stage* s = find_stage(name);
  if (!s) {
    stages_.push_back(Stage{std::string(name), {}, false, 0, 0});
    s = &stages_.back();
  }
  s->started = Clock::now();
  s->running = true;
}

void MetricsRegistry::end_stage(std::string_view name) {
  Stage* s = find_stage(name);
  if (!s || !s->running) return;
  s->total_ms += static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - s->started).count());
  s->running = false;
  ++s->runs;
}

void MetricsRegistry::add_field_error(std::string_view column) {
  ++bad_fields_;
  ++errors_by_column_[std::string(column)];
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows = rows_;
  r.bad_rows = bad_rows_;
  r.bad_fields = bad_fields_;
  r.bytes = bytes_;
  r.throughput_mb_s = per_second(bytes_ / (1024.0 * 1024.0), wall_ms);
  r.rows_per_sec = per_second(static_cast<double>(rows_), wall_ms);
  r.errors_by_field = errors_by_column_;
  for (const auto& s : stages_)
    if (s.runs > 0) r.stages.push_back(StageTiming{s.name, s.total_ms});
  return r;
}

}
