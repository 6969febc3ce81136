#ifndef TASKMAN_COMMON_SPDLOGHELPER_HPP
#define TASKMAN_COMMON_SPDLOGHELPER_HPP
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

#include <spdlog/common.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace Taskman::SpdLogHelper
{
  /// @brief Gets or creates a module logger that writes to the default logger's sinks.
  ///
  /// Module loggers are not cached here: ConfigureLogging drops the registry when the sinks change,
  /// so the next lookup picks up the new configuration.
  /// @param name The logger name, shown as the %n field of the pattern.
  /// @return Shared pointer to the logger.
  inline std::shared_ptr<spdlog::logger> GetLogger(const std::string& name)
  {
    auto log = spdlog::get(name);
    if (!log)
    {
      auto defaultLogger = spdlog::default_logger();
      // Use default logger's sinks - inherits global configuration
      log = std::make_shared<spdlog::logger>(name, defaultLogger->sinks().begin(), defaultLogger->sinks().end());
      log->set_level(defaultLogger->level());
      try
      {
        spdlog::register_logger(log);
      }
      catch (const spdlog::spdlog_ex&)
      {
        // Another thread registered the name between the lookup and the registration
        auto registered = spdlog::get(name);
        if (!registered)
        {
          throw;
        }
        log = std::move(registered);
      }
    }
    return log;
  }
}

#endif
