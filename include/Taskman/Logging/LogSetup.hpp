#ifndef TASKMAN_LOGGING_LOGSETUP_HPP
#define TASKMAN_LOGGING_LOGSETUP_HPP
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

#include <Taskman/Logging/LoggingConfig.hpp>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace Taskman
{
  /// @brief The sink pattern for @p config: LoggingConfig::Pattern followed by the base fields.
  ///
  /// '%' inside a base field is escaped so that spdlog writes it literally.
  std::string BuildLogPattern(const LoggingConfig& config);

  /// @brief Installs the default spdlog logger according to @p config.
  ///
  /// With the stdio transport every diagnostic is written to stderr, otherwise to stdout.
  /// Previously registered module loggers are dropped so that SpdLogHelper::GetLogger recreates them
  /// on the new sinks.
  /// @param config The logging configuration.
  /// @param name Name of the new default logger.
  /// @return The new default logger.
  std::shared_ptr<spdlog::logger> ConfigureLogging(const LoggingConfig& config, const std::string& name = "taskman");
}

#endif
