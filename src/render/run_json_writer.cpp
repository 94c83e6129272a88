#include "fwf/run_json.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>
#include <cmath> // std::isfinite

namespace fwf {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8]; std::snprintf(u, sizeof(u), "\\u%04x", c);
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << p.rows << ",";
  o << "\"bad_rows\":" << p.bad_rows << ",";
  o << "\"bad_fields\":" << p.bad_fields << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"rows_per_sec\":" << safe_num(p.rows_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  // sorted so reports diff cleanly between runs
  std::vector<std::pair<std::string, std::uint64_t>> errs(p.errors_by_field.begin(), p.errors_by_field.end());
  std::sort(errs.begin(), errs.end());
  o << "\"errors_by_field\":{";
  for (size_t i=0;i<errs.size();++i){
    if (i) o << ",";
    esc(o, errs[i].first); o << ":" << errs[i].second;
  }
  o << "},";

  o << "\"columns\":[";
  for (size_t i=0;i<p.columns.size();++i){
    if (i) o << ",";
    esc(o, p.columns[i]);
  }
  o << "],";

  o << "\"filename\":";  esc(o, p.filename); o << ",";
  o << "\"layout\":";    esc(o, p.layout);   o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"expected_size\":" << p.expected_size << ",";
  o << "\"expected_rows\":" << p.expected_rows << ",";
  o << "\"size_ok\":" << (p.size_ok ? "true" : "false") << ",";
  o << "\"record_length\":" << p.record_length << ",";
  o << "\"terminator_width\":" << p.terminator_width;

  o << "}";
  return o.str();
}

}
