#include <railpath/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace railpath {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};
std::once_flag g_env_once;
std::mutex g_write_mutex;

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Info:  return "info";
    case LogLevel::Debug: return "debug";
    case LogLevel::Trace: return "trace";
  }
  return "info";
}

bool parse_level(std::string s, LogLevel& out) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "error")                  { out = LogLevel::Error; return true; }
  if (s == "warn" || s == "warning") { out = LogLevel::Warn;  return true; }
  if (s == "info")                   { out = LogLevel::Info;  return true; }
  if (s == "debug")                  { out = LogLevel::Debug; return true; }
  if (s == "trace")                  { out = LogLevel::Trace; return true; }
  return false;
}

} // namespace

void set_log_level(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }

LogLevel log_level() { return g_level.load(std::memory_order_relaxed); }

bool should_log(LogLevel level) {
  return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(log_level());
}

void init_log_level_from_env() {
  std::call_once(g_env_once, [] {
    const char* env = std::getenv("RAILPATH_LOG_LEVEL");
    if (!env) return;
    LogLevel lv{};
    if (parse_level(env, lv)) {
      set_log_level(lv);
    } else {
      std::cerr << "[railpath][warn] unknown RAILPATH_LOG_LEVEL '" << env << "'\n";
    }
  });
}

LogLine::LogLine(LogLevel level, std::string_view category)
  : level_(level), category_(category) {}

LogLine::~LogLine() {
  std::lock_guard<std::mutex> lock(g_write_mutex);
  std::ostream& out = (level_ <= LogLevel::Warn) ? std::cerr : std::cout;
  out << "[railpath]";
  if (!category_.empty()) out << "[" << category_ << "]";
  if (level_ != LogLevel::Info) out << "[" << level_name(level_) << "]";
  out << " " << stream_.str() << "\n";
}

} // namespace railpath
