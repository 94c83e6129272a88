#include "fwf/artifact_writer.hpp"
#include "fwf/collector.hpp"
#include "fwf/errors.hpp"
#include "fwf/layout_loader.hpp"
#include "fwf/log_sink.hpp"
#include "fwf/metrics.hpp"
#include "fwf/path_utils.hpp"
#include "fwf/record_reader.hpp"
#include "fwf/run_json.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int kExitUsage  = 2;
constexpr int kExitIo     = 3;
constexpr int kExitReport = 4;

struct Cli {
  std::string layout;                 // descriptor JSON; sibling <file>.layout.json if empty
  std::string out;                    // CSV output (single input) or directory (several)
  bool keyed = false;
  std::size_t chunk_records = 1000;
  int max_field_failures = 3;
  bool trim = true;
  std::string log_level = "warn";
  std::string artifact_root = "artifacts/fwf-scan";
  std::string slug_mode = "hashprefix"; // hashprefix|basename|keypath
  int slug_len = 8;
  bool report = true;
  std::vector<std::string> scans;
};

void usage(std::ostream& o) {
  o <<
    "Usage: fwf-scan [--layout=FILE] [--out=FILE.csv|DIR] [--keyed]\n"
    "                [--chunk-records=N] [--max-field-failures=N] [--no-trim]\n"
    "                [--log-level=debug|info|warn|error]\n"
    "                [--artifact-root=DIR] [--slug-mode=hashprefix|basename|keypath]\n"
    "                [--slug-len=N] [--no-report]\n"
    "                (--scan <file> | --scan=<file> | <file>)...\n";
}

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoi(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    int n = 0;
    if (eat("--layout=", &c.layout)) continue;
    if (eat("--out=", &c.out)) continue;
    if (eat_i("--chunk-records=", &n)) {
      if (n <= 0) { std::cerr << "--chunk-records must be > 0\n"; return false; }
      c.chunk_records = static_cast<std::size_t>(n);
      continue;
    }
    if (eat_i("--max-field-failures=", &c.max_field_failures)) {
      if (c.max_field_failures < 0) { std::cerr << "--max-field-failures must be >= 0\n"; return false; }
      continue;
    }
    if (eat("--log-level=", &c.log_level)) continue;
    if (eat("--artifact-root=", &c.artifact_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat_i("--slug-len=", &c.slug_len)) continue;
    if (a == "--keyed")     { c.keyed  = true;  continue; }
    if (a == "--no-trim")   { c.trim   = false; continue; }
    if (a == "--no-report") { c.report = false; continue; }
    if (a == "--scan" && i+1 < argc) { c.scans.push_back(argv[++i]); continue; }
    if (a.rfind("--scan=",0)==0) { c.scans.push_back(a.substr(7)); continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "unknown option: " << a << "\n"; return false; }
    c.scans.push_back(a);
  }
  return true;
}

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  // hash the absolute path so slugs are stable across working directories
  std::string key = (mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
      : path;
  return fwf::make_slug(key, mode, len);
}

std::string csv_path_for(const Cli& cli, const std::string& filepath) {
  if (cli.out.empty()) return {};
  if (cli.scans.size() == 1 && !std::filesystem::is_directory(cli.out)) return cli.out;
  auto name = std::filesystem::path(filepath).filename();
  name.replace_extension(".csv");
  return (std::filesystem::path(cli.out) / name).string();
}

int scan_one_file(const std::string& filepath, const Cli& cli, fwf::LogSink& log) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  // --- layout
  std::string layout_path = cli.layout;
  if (layout_path.empty()) {
    auto sib = fwf::sibling_layout(filepath);
    if (!sib) {
      std::cerr << "[scan] no --layout and no " << filepath << ".layout.json\n";
      return kExitUsage;
    }
    layout_path = sib->string();
  }
  std::unique_ptr<fwf::FileLayout> layout;
  try {
    layout = std::make_unique<fwf::FileLayout>(fwf::load_layout(layout_path, filepath));
  } catch (const fwf::InvalidSpecError& e) {
    std::cerr << "[scan] bad layout " << layout_path << ": " << e.what() << "\n";
    return kExitUsage;
  }

  // --- reader
  fwf::MetricsRegistry metrics;
  fwf::RecordReader::Config rcfg;
  rcfg.chunk_records = cli.chunk_records;
  rcfg.shape = cli.keyed ? fwf::RecordReader::Shape::Keyed : fwf::RecordReader::Shape::Positional;
  rcfg.trim_text = cli.trim;
  rcfg.max_field_failures = cli.max_field_failures;
  rcfg.log = &log;
  rcfg.metrics = &metrics;

  // --- output
  std::ofstream csv_file;
  std::unique_ptr<fwf::CsvWriter> csv;
  const std::string csv_path = csv_path_for(cli, filepath);
  if (!csv_path.empty()) {
    if (!fwf::ensure_parent_dirs(csv_path)) {
      std::cerr << "[scan] cannot create directory for " << csv_path << "\n";
      return kExitIo;
    }
    csv_file.open(csv_path, std::ios::binary);
    if (!csv_file) {
      std::cerr << "[scan] cannot write " << csv_path << "\n";
      return kExitIo;
    }
    csv = std::make_unique<fwf::CsvWriter>(csv_file);
  }

  std::unique_ptr<fwf::RecordReader> reader_ptr;
  try {
    reader_ptr = std::make_unique<fwf::RecordReader>(*layout, rcfg);
  } catch (const fwf::InvalidSpecError& e) {
    std::cerr << "[scan] " << e.what() << "\n";
    return kExitUsage;
  }
  fwf::RecordReader& reader = *reader_ptr;
  std::uint64_t rows = 0;
  try {
    metrics.start_stage("open");
    fwf::OpenScope scope(reader);
    metrics.end_stage("open");
    {
      fwf::StageScope stage(metrics, "scan");
      if (csv) csv->write_header(reader.column_names());
      rows = reader.for_each_record([&](const fwf::Record& r){
        if (csv) csv->write_row(r);
      });
    }
    if (csv) {
      csv->flush();
      if (!csv_file) {
        std::cerr << "[scan] write failed: " << csv_path << "\n";
        return kExitIo;
      }
    }
  } catch (const fwf::IoError& e) {
    std::cerr << "[scan] " << e.what() << "\n";
    return kExitIo;
  }

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const fwf::RunStats stats = metrics.snapshot(wall_ms);

  std::cout << "[scan] ok: " << filepath
            << " rows=" << rows << " bad=" << reader.bad_lines()
            << " bad_fields=" << reader.bad_fields() << "\n";

  if (!cli.report) return 0;

  // --- run.json payload
  fwf::RunJsonPayload p{};
  p.rows = stats.rows;
  p.bad_rows = stats.bad_rows;
  p.bad_fields = stats.bad_fields;
  p.bytes = stats.bytes;
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = stats.throughput_mb_s;
  p.rows_per_sec = stats.rows_per_sec;
  for (const auto& s : stats.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
  p.errors_by_field = stats.errors_by_field;

  p.filename = filepath;
  p.layout = layout_path;
  p.file_size = layout->actual_size().value_or(0);
  if (layout->expected_size()) p.expected_size = static_cast<std::int64_t>(*layout->expected_size());
  if (layout->expected_rows()) p.expected_rows = static_cast<std::int64_t>(*layout->expected_rows());
  fwf::NullSink quiet;
  p.size_ok = layout->validate(quiet, reader.terminator_width());
  p.record_length = layout->record_length();
  p.terminator_width = reader.terminator_width();
  p.columns = layout->column_names();

  const std::string slug = make_slug_for(filepath, cli.slug_mode, cli.slug_len);
  std::string err;
  if (!fwf::write_report_dir(cli.artifact_root, slug, p, &err)) {
    std::cerr << "[scan] write_report_dir failed: " << err << "\n";
    return kExitReport;
  }
  std::cout << "[scan] report: " << cli.artifact_root << "/" << slug << "/report.html\n";
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return kExitUsage; }
  } catch (const std::exception& e) {
    std::cerr << "bad argument: " << e.what() << "\n";
    usage(std::cerr);
    return kExitUsage;
  }
  if (cli.scans.empty()) { usage(std::cerr); return kExitUsage; }

  fwf::LogLevel lvl;
  if (!fwf::parse_log_level(cli.log_level, lvl)) {
    std::cerr << "unknown log level: " << cli.log_level << "\n";
    return kExitUsage;
  }
  fwf::StderrSink log(lvl);

  int rc = 0;
  for (const auto& f : cli.scans) {
    int r = scan_one_file(f, cli, log);
    if (r != 0 && rc == 0) rc = r;
  }
  return rc;
}
