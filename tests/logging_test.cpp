#include <pyscan/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  pyscan::StructuredLogger logger(stream, {pyscan::LogLevel::kInfo});

  logger.Log(pyscan::LogLevel::kDebug, "debug message", {});
  logger.Log(pyscan::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  pyscan::StructuredLogger logger(stream, {pyscan::LogLevel::kDebug});

  logger.Log(pyscan::LogLevel::kDebug, "analysis.complete",
             {{"file", "app.py"}, {"issues", "3"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"file\": \"app.py\""));
  EXPECT_NE(std::string::npos, output.find("\"issues\": \"3\"}"));
  EXPECT_NE(std::string::npos, output.find("message=\"analysis.complete\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = pyscan::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<pyscan::NullLogger>(provided));

  auto custom = std::make_shared<pyscan::StructuredLogger>(
      std::cout, pyscan::LoggingConfig{});
  EXPECT_EQ(custom, pyscan::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLevelNames) {
  EXPECT_EQ(pyscan::LogLevel::kDebug, pyscan::ParseLogLevel("DEBUG"));
  EXPECT_EQ(pyscan::LogLevel::kWarn, pyscan::ParseLogLevel("warning"));
  EXPECT_EQ("info", pyscan::LogLevelName(pyscan::ParseLogLevel(" info ")));
  EXPECT_THROW(pyscan::ParseLogLevel("verbose"), std::invalid_argument);
}

} // namespace
