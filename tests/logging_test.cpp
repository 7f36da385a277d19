#include <reorg/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  reorg::StructuredLogger logger(stream, {reorg::LogLevel::kInfo});

  logger.Log(reorg::LogLevel::kDebug, "debug message", {});
  logger.Log(reorg::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  reorg::StructuredLogger logger(stream, {reorg::LogLevel::kDebug});

  logger.Log(reorg::LogLevel::kDebug, "pipeline.stage.complete",
             {{"stage", "plan"}, {"jobs", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"stage\": \"plan\""));
  EXPECT_NE(std::string::npos, output.find("\"jobs\": \"42\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"pipeline.stage.complete\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = reorg::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<reorg::NullLogger>(provided));

  auto custom = std::make_shared<reorg::StructuredLogger>(
      std::cout, reorg::LoggingConfig{});
  EXPECT_EQ(custom, reorg::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLevelNames) {
  EXPECT_EQ(reorg::ParseLogLevel("debug"), reorg::LogLevel::kDebug);
  EXPECT_EQ(reorg::ParseLogLevel(" INFO "), reorg::LogLevel::kInfo);
  EXPECT_EQ(reorg::ParseLogLevel("warning"), reorg::LogLevel::kWarn);
  EXPECT_EQ(reorg::ParseLogLevel("error"), reorg::LogLevel::kError);
  EXPECT_THROW(reorg::ParseLogLevel("chatty"), std::invalid_argument);
  EXPECT_EQ(reorg::LevelName(reorg::LogLevel::kWarn), "warn");
}

TEST(LoggingTest, KeepsLinesIntactAcrossThreads) {
  std::stringstream stream;
  reorg::StructuredLogger logger(stream, {reorg::LogLevel::kInfo});

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&logger, t]() {
      for (int i = 0; i < 50; ++i) {
        logger.Log(reorg::LogLevel::kInfo, "transfer.progress",
                   {{"worker", std::to_string(t)}});
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  std::string line;
  int lines = 0;
  while (std::getline(stream, line)) {
    ++lines;
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(std::string::npos, line.find("message=\"transfer.progress\""));
  }
  EXPECT_EQ(lines, 400);
}

} // namespace
