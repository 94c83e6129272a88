#include "fwf/artifact_writer.hpp"
#include "fwf/mustache_renderer.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fwf {

static std::string fmt2(double v) {
  char tmp[32];
  std::snprintf(tmp, sizeof(tmp), "%.2f", v);
  return tmp;
}

RenderContext make_report_context(const RunJsonPayload& p) {
  RenderContext ctx;
  ctx.json = RunJsonWriter::to_json(p);
  ctx.values = {
    {"filename", p.filename},
    {"layout", p.layout},
    {"rows", std::to_string(p.rows)},
    {"bad_rows", std::to_string(p.bad_rows)},
    {"bad_fields", std::to_string(p.bad_fields)},
    {"bytes", std::to_string(p.bytes)},
    {"file_size", std::to_string(p.file_size)},
    {"record_length", std::to_string(p.record_length)},
    {"terminator_width", std::to_string(p.terminator_width)},
    {"wall_time_ms", fmt2(p.wall_time_ms)},
    {"throughput_mb_s", fmt2(p.throughput_mb_s)},
    {"rows_per_sec", fmt2(p.rows_per_sec)},
    {"size_status", p.size_ok ? "ok" : "mismatch"},
  };
  if (p.expected_size >= 0) ctx.values["expected_size"] = std::to_string(p.expected_size);
  if (p.expected_rows >= 0) ctx.values["expected_rows"] = std::to_string(p.expected_rows);

  auto& cols = ctx.lists["columns"];
  for (const auto& c : p.columns) cols.push_back({{"name", c}});

  std::vector<std::pair<std::string, std::uint64_t>> errs(p.errors_by_field.begin(), p.errors_by_field.end());
  std::sort(errs.begin(), errs.end(),
            [](const auto& a, const auto& b){ return a.second != b.second ? a.second > b.second : a.first < b.first; });
  auto& errors = ctx.lists["errors"];
  for (const auto& e : errs) errors.push_back({{"field", e.first}, {"count", std::to_string(e.second)}});
  if (!errs.empty()) ctx.values["has_errors"] = "yes";

  auto& stages = ctx.lists["stages"];
  for (const auto& s : p.stage_times) stages.push_back({{"stage", s.first}, {"duration_ms", std::to_string(s.second)}});
  return ctx;
}

bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const RunJsonPayload& payload,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;

  RenderContext ctx = make_report_context(payload);

  // (A) run.json next to report.html
  {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    std::ofstream rj(out_dir / "run.json", std::ios::binary);
    if (!rj) {
      if (err_out) *err_out = "failed to write run.json";
      return false;
    }
    rj.write(ctx.json.data(), static_cast<std::streamsize>(ctx.json.size()));
  }

  // (B) report.html
  MustacheRenderer::Config rcfg;
#ifdef FWF_DEFAULT_TEMPLATE_DIR
  rcfg.template_dir = FWF_DEFAULT_TEMPLATE_DIR;
#else
  rcfg.template_dir = "templates";
#endif
  rcfg.partials_dir = rcfg.template_dir + "/partials";

  MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_file("report.mustache", ctx,
                                          (out_dir / "report.html").string());
  if (!ok && err_out) *err_out = renderer.last_error();
  return ok;
}

}
