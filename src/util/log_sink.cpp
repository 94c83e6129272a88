#include "fwf/log_sink.hpp"
#include <algorithm>
#include <iostream>

namespace fwf {

std::string_view level_name(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}

bool parse_log_level(std::string_view s, LogLevel& out) {
  if (s == "debug") { out = LogLevel::Debug; return true; }
  if (s == "info")  { out = LogLevel::Info;  return true; }
  if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
  if (s == "error") { out = LogLevel::Error; return true; }
  return false;
}

void StderrSink::log(LogLevel lvl, std::string_view msg) {
  if (lvl < min_) return;
  std::lock_guard<std::mutex> lk(mu_);
  std::cerr << "[fwf] " << level_name(lvl) << ": " << msg << "\n";
}

void MemorySink::log(LogLevel lvl, std::string_view msg) {
  std::string line(level_name(lvl));
  line += ": ";
  line.append(msg.data(), msg.size());
  lines_.push_back(std::move(line));
  levels_.push_back(lvl);
}

std::size_t MemorySink::count(LogLevel lvl) const {
  return static_cast<std::size_t>(std::count(levels_.begin(), levels_.end(), lvl));
}

LogSink& default_sink() {
  static StderrSink sink(LogLevel::Warn);
  return sink;
}

}
