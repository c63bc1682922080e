#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using linkwatch::core::logging::Logger;
using linkwatch::core::logging::LogLevel;

TEST_CASE("Log lines carry level category target and quoted fields", "[core][logging]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kInfo, sink);
  logger.SetTarget("192.0.2.1");

  logger.Warn(linkwatch::core::logging::kCategoryOutage, "Lost contact after 3 missed probes",
              {{"at", "2024-03-10T12:10:00.000Z"}, {"detail", "say \"hi\"\nbye"}});

  const std::string line = sink.str();
  REQUIRE(line.rfind("ts_utc=", 0) == 0U);
  REQUIRE(line.find(" level=WARN category=\"OUTAGE\" target=\"192.0.2.1\" "
                    "msg=\"Lost contact after 3 missed probes\"") != std::string::npos);
  REQUIRE(line.find(" at=\"2024-03-10T12:10:00.000Z\"") != std::string::npos);
  REQUIRE(line.find(R"( detail="say \"hi\"\nbye")") != std::string::npos);
  REQUIRE(line.back() == '\n');
}

TEST_CASE("Lines below the minimum level are dropped", "[core][logging]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kWarn, sink);

  logger.Info(linkwatch::core::logging::kCategoryPing, "echo reply");
  REQUIRE(sink.str().empty());
  REQUIRE_FALSE(logger.ShouldLog(LogLevel::kDebug));

  logger.SetMinLevel(LogLevel::kDebug);
  logger.Debug(linkwatch::core::logging::kCategoryTrace, "latency classified");
  REQUIRE(sink.str().find("level=DEBUG") != std::string::npos);
}

TEST_CASE("Log level names parse case-insensitively with aliases", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;

  REQUIRE(linkwatch::core::logging::ParseLogLevel("TRACE", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(linkwatch::core::logging::ParseLogLevel("Warning", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE(linkwatch::core::logging::ParseLogLevel("error", level, error));
  REQUIRE(level == LogLevel::kError);

  REQUIRE_FALSE(linkwatch::core::logging::ParseLogLevel("loud", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
  REQUIRE_FALSE(linkwatch::core::logging::ParseLogLevel("", level, error));
}

TEST_CASE("File sink appends across logger instances", "[core][logging]") {
  const auto dir = linkwatch::tests::common::CreateUniqueTempDir("linkwatch-logger-test");
  const auto path = dir / "linkwatch.log";
  std::string error;

  {
    Logger logger(LogLevel::kInfo);
    REQUIRE(logger.OpenFile(path, error));
    logger.Info(linkwatch::core::logging::kCategoryMonitor, "monitor started");
  }
  {
    Logger logger(LogLevel::kInfo);
    REQUIRE(logger.OpenFile(path, error));
    logger.Info(linkwatch::core::logging::kCategoryMonitor, "monitor stopped");
  }

  const std::string text = linkwatch::tests::common::ReadFileToString(path);
  REQUIRE(linkwatch::tests::common::CountOccurrences(text, "category=\"MONITOR\"") == 2U);

  std::ostringstream fallback;
  Logger unopened(LogLevel::kInfo, fallback);
  REQUIRE_FALSE(unopened.OpenFile(dir / "missing" / "linkwatch.log", error));
  REQUIRE(error.find("cannot open log file") != std::string::npos);
  unopened.Info(linkwatch::core::logging::kCategoryMonitor, "still here");
  REQUIRE(fallback.str().find("still here") != std::string::npos);

  linkwatch::tests::common::RemovePathBestEffort(dir);
}
