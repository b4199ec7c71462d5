#pragma once
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace railpath {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn  = 1,
  Info  = 2,
  Debug = 3,
  Trace = 4
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool should_log(LogLevel level);

// Reads RAILPATH_LOG_LEVEL (error|warn|info|debug|trace) once.
void init_log_level_from_env();

// One log line; written out when the object is destroyed.
class LogLine {
public:
  LogLine(LogLevel level, std::string_view category);
  ~LogLine();
  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  std::ostream& stream() { return stream_; }

private:
  LogLevel level_;
  std::string category_;
  std::ostringstream stream_;
};

} // namespace railpath

#define RAILPATH_LOG_STREAM(level, category) \
  if (!::railpath::should_log(level)) {} else ::railpath::LogLine((level), (category)).stream()

#define RAILPATH_LOGE(category) RAILPATH_LOG_STREAM(::railpath::LogLevel::Error, (category))
#define RAILPATH_LOGW(category) RAILPATH_LOG_STREAM(::railpath::LogLevel::Warn,  (category))
#define RAILPATH_LOGI(category) RAILPATH_LOG_STREAM(::railpath::LogLevel::Info,  (category))
#define RAILPATH_LOGD(category) RAILPATH_LOG_STREAM(::railpath::LogLevel::Debug, (category))
#define RAILPATH_LOGT(category) RAILPATH_LOG_STREAM(::railpath::LogLevel::Trace, (category))
