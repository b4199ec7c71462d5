#include <catch2/catch_test_macros.hpp>

#include <railpath/log.hpp>

using namespace railpath;

TEST_CASE("Log level gates lines") {
  const LogLevel saved = log_level();

  set_log_level(LogLevel::Warn);
  REQUIRE(should_log(LogLevel::Error));
  REQUIRE(should_log(LogLevel::Warn));
  REQUIRE_FALSE(should_log(LogLevel::Info));
  REQUIRE_FALSE(should_log(LogLevel::Trace));

  set_log_level(LogLevel::Trace);
  REQUIRE(should_log(LogLevel::Debug));
  REQUIRE(should_log(LogLevel::Trace));

  set_log_level(saved);
}

TEST_CASE("Disabled log lines do not evaluate their operands") {
  const LogLevel saved = log_level();
  set_log_level(LogLevel::Error);

  int evaluated = 0;
  auto touch = [&]{ ++evaluated; return 1; };
  RAILPATH_LOGD("test") << touch();
  RAILPATH_LOGI("test") << touch();
  REQUIRE(evaluated == 0);

  RAILPATH_LOGE("test") << "visible " << touch();
  REQUIRE(evaluated == 1);

  set_log_level(saved);
}
