#pragma once
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fwf {

enum class LogLevel { Debug, Info, Warn, Error };

std::string_view level_name(LogLevel lvl) noexcept;
bool parse_log_level(std::string_view s, LogLevel& out);

// Injected logging target. Readers and layouts never touch a global logger.
class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void log(LogLevel lvl, std::string_view msg) = 0;

  void debug(std::string_view m) { log(LogLevel::Debug, m); }
  void info(std::string_view m)  { log(LogLevel::Info, m); }
  void warn(std::string_view m)  { log(LogLevel::Warn, m); }
  void error(std::string_view m) { log(LogLevel::Error, m); }
};

// "[fwf] warn: ..." lines on std::cerr.
class StderrSink : public LogSink {
public:
  explicit StderrSink(LogLevel min_level = LogLevel::Warn) : min_(min_level) {}
  void log(LogLevel lvl, std::string_view msg) override;
  void set_min_level(LogLevel lvl) noexcept { min_ = lvl; }

private:
  LogLevel min_;
  std::mutex mu_;
};

class NullSink : public LogSink {
public:
  void log(LogLevel, std::string_view) override {}
};

// Keeps formatted lines; handy in tests.
class MemorySink : public LogSink {
public:
  void log(LogLevel lvl, std::string_view msg) override;
  const std::vector<std::string>& lines() const noexcept { return lines_; }
  std::size_t count(LogLevel lvl) const;
  void clear() { lines_.clear(); levels_.clear(); }

private:
  std::vector<std::string> lines_;
  std::vector<LogLevel> levels_;
};

// Shared stderr sink used when a caller does not inject one.
LogSink& default_sink();

}
