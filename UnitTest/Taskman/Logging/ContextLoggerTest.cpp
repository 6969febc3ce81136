//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <Taskman/Common/SpdLogHelper.hpp>
#include <Taskman/Logging/ContextLogger.hpp>
#include <Taskman/Logging/LogRedaction.hpp>
#include <Taskman/Logging/LogSetup.hpp>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace Taskman
{
  class ContextLoggerTest : public ::testing::Test
  {
  protected:
    std::ostringstream m_output;
    std::shared_ptr<spdlog::logger> m_logger;

    void SetUp() override
    {
      auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(m_output);
      m_logger = std::make_shared<spdlog::logger>("context-logger-test", sink);
      m_logger->set_pattern("%l %v");
      m_logger->set_level(spdlog::level::trace);
    }
  };

  TEST_F(ContextLoggerTest, With_ReturnsChildAndLeavesParentUntouched)
  {
    const ContextLogger parent(m_logger);

    const auto child = parent.With("requestId", "req-1").With("tool", "list_tasks");

    EXPECT_TRUE(parent.GetFields().empty());
    EXPECT_EQ(child.GetFields().size(), 2u);
    EXPECT_EQ(child.FindField("tool"), std::optional<std::string>("list_tasks"));
  }

  TEST_F(ContextLoggerTest, With_SameKey_ReplacesValueInPlace)
  {
    const auto logger = ContextLogger(m_logger).With("a", "1").With("b", "2").With("a", "3");

    EXPECT_EQ(logger.RenderFields(), " a=3 b=2");
  }

  TEST_F(ContextLoggerTest, Info_AppendsBoundFields)
  {
    const auto logger = ContextLogger(m_logger).With("requestId", "req-7");

    logger.Info("Tool call started: {}", "get_task");

    EXPECT_EQ(m_output.str(), "info Tool call started: get_task requestId=req-7\n");
  }

  TEST_F(ContextLoggerTest, Debug_BelowLevel_IsNotWritten)
  {
    m_logger->set_level(spdlog::level::info);
    const ContextLogger logger(m_logger);

    logger.Debug("hidden {}", 1);
    logger.Warn("shown {}", 2);

    EXPECT_EQ(m_output.str(), "warning shown 2\n");
  }

  TEST_F(ContextLoggerTest, NullLogger_FallsBackToDefault)
  {
    const ContextLogger logger(nullptr);

    EXPECT_EQ(logger.GetLogger(), spdlog::default_logger());
  }

  TEST_F(ContextLoggerTest, Info_SensitiveField_IsRedactedInOutput)
  {
    const auto logger = ContextLogger(m_logger).With("requestId", "req-9").With("token", "abc123");

    logger.Info("Backend call");

    EXPECT_EQ(m_output.str(), "info Backend call requestId=req-9 token=[REDACTED]\n");
    EXPECT_EQ(m_output.str().find("abc123"), std::string::npos);
  }

  TEST_F(ContextLoggerTest, Info_SensitiveFieldMatching_IgnoresCaseAndPrefix)
  {
    const auto logger = ContextLogger(m_logger).With("Authorization", "Bearer xyz").With("headers.cookie", "sid=1").With("apiKey", "k").With("tokenizer", "bpe");

    logger.Info("Outbound");

    EXPECT_EQ(m_output.str(), "info Outbound Authorization=[REDACTED] headers.cookie=[REDACTED] apiKey=[REDACTED] tokenizer=bpe\n");
  }

  TEST_F(ContextLoggerTest, FindField_SensitiveField_KeepsRawValue)
  {
    const auto logger = ContextLogger(m_logger).With("password", "hunter2");

    EXPECT_EQ(logger.FindField("password"), std::optional<std::string>("hunter2"));
    EXPECT_EQ(logger.RenderFields(), " password=[REDACTED]");
  }

  TEST(LogRedactionTest, IsSensitiveField)
  {
    EXPECT_TRUE(LogRedaction::IsSensitiveField("password"));
    EXPECT_TRUE(LogRedaction::IsSensitiveField("SECRET"));
    EXPECT_TRUE(LogRedaction::IsSensitiveField("api_key"));
    EXPECT_TRUE(LogRedaction::IsSensitiveField("request.headers.Authorization"));
    EXPECT_FALSE(LogRedaction::IsSensitiveField("requestId"));
    EXPECT_FALSE(LogRedaction::IsSensitiveField("token.count"));
    EXPECT_FALSE(LogRedaction::IsSensitiveField(""));
  }

  // ============================================================================
  // Log setup
  // ============================================================================

  TEST(LogSetupTest, ConfigureLogging_InstallsDefaultLoggerAndModuleLoggersFollow)
  {
    LoggingConfig config;
    config.Level = spdlog::level::warn;

    auto logger = ConfigureLogging(config, "taskman-test");

    EXPECT_EQ(spdlog::default_logger(), logger);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    auto moduleLogger = SpdLogHelper::GetLogger("LogSetupTestModule");
    EXPECT_EQ(moduleLogger->level(), spdlog::level::warn);
    EXPECT_EQ(moduleLogger->sinks(), logger->sinks());
    EXPECT_EQ(SpdLogHelper::GetLogger("LogSetupTestModule"), moduleLogger);

    // Restore a quiet default for the remaining tests
    config.Level = spdlog::level::err;
    ConfigureLogging(config);
  }

  TEST(LogSetupTest, BuildLogPattern_AppendsBaseFieldsEscapedAndRedacted)
  {
    LoggingConfig config;
    config.Pattern = "%l %v";
    config.BaseFields = {{"service", "taskman-mcp"}, {"environment", "100%"}, {"secret", "s3"}};

    EXPECT_EQ(BuildLogPattern(config), "%l %v service=taskman-mcp environment=100%% secret=[REDACTED]");
  }

  TEST(LogSetupTest, BuildLogPattern_NoBaseFields_IsThePattern)
  {
    LoggingConfig config;

    EXPECT_EQ(BuildLogPattern(config), LoggingConfig::DefaultPattern);
  }

  TEST(LogSetupTest, GetLogger_ConcurrentFirstLookups_ReturnTheSameLogger)
  {
    constexpr std::size_t ThreadCount = 8;
    std::atomic<bool> start{false};
    std::vector<std::shared_ptr<spdlog::logger>> loggers(ThreadCount);
    std::vector<std::thread> threads;
    threads.reserve(ThreadCount);

    for (std::size_t i = 0; i < ThreadCount; ++i)
    {
      threads.emplace_back(
        [&start, &loggers, i]()
        {
          while (!start.load())
          {
            std::this_thread::yield();
          }
          loggers[i] = SpdLogHelper::GetLogger("ConcurrentModule");
        });
    }
    start.store(true);
    for (auto& thread : threads)
    {
      thread.join();
    }

    ASSERT_NE(loggers[0], nullptr);
    for (const auto& logger : loggers)
    {
      EXPECT_EQ(logger, loggers[0]);
    }
    EXPECT_EQ(spdlog::get("ConcurrentModule"), loggers[0]);
  }
}
