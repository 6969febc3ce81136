#ifndef TASKMAN_LOGGING_CONTEXTLOGGER_HPP
#define TASKMAN_LOGGING_CONTEXTLOGGER_HPP
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

#include <Taskman/Logging/LogRedaction.hpp>
#include <fmt/format.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Taskman
{
  /// @brief A spdlog logger with a set of bound structured fields.
  ///
  /// Every message is written as "<message> key=value key=value" with the fields in binding order.
  /// Values of sensitive keys (see LogRedaction::IsSensitiveField) are written as "[REDACTED]".
  /// Binding returns a new child logger; the parent is never modified.
  class ContextLogger
  {
  public:
    using Field = std::pair<std::string, std::string>;

  private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::vector<Field> m_fields;

  public:
    /// @brief Wraps the current default logger.
    ContextLogger()
      : m_logger(spdlog::default_logger())
    {
    }

    explicit ContextLogger(std::shared_ptr<spdlog::logger> logger)
      : m_logger(logger ? std::move(logger) : spdlog::default_logger())
    {
    }

    /// @brief Child logger with @p key bound to @p value. An existing binding of @p key is replaced.
    [[nodiscard]] ContextLogger With(std::string key, std::string value) const
    {
      ContextLogger child(*this);
      for (auto& field : child.m_fields)
      {
        if (field.first == key)
        {
          field.second = std::move(value);
          return child;
        }
      }
      child.m_fields.emplace_back(std::move(key), std::move(value));
      return child;
    }

    const std::shared_ptr<spdlog::logger>& GetLogger() const noexcept
    {
      return m_logger;
    }

    const std::vector<Field>& GetFields() const noexcept
    {
      return m_fields;
    }

    std::optional<std::string> FindField(const std::string& key) const
    {
      for (const auto& field : m_fields)
      {
        if (field.first == key)
        {
          return field.second;
        }
      }
      return std::nullopt;
    }

    /// @brief The bound fields rendered as " key=value" pairs with sensitive values masked (empty when nothing is bound).
    std::string RenderFields() const
    {
      std::string result;
      for (const auto& field : m_fields)
      {
        fmt::format_to(std::back_inserter(result), " {}={}", field.first, LogRedaction::MaskValue(field.first, field.second));
      }
      return result;
    }

    template <typename... Args>
    void Log(const spdlog::level::level_enum level, fmt::format_string<Args...> format, Args&&... args) const
    {
      if (!m_logger->should_log(level))
      {
        return;
      }
      m_logger->log(level, "{}{}", fmt::format(format, std::forward<Args>(args)...), RenderFields());
    }

    template <typename... Args>
    void Trace(fmt::format_string<Args...> format, Args&&... args) const
    {
      Log(spdlog::level::trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Debug(fmt::format_string<Args...> format, Args&&... args) const
    {
      Log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Info(fmt::format_string<Args...> format, Args&&... args) const
    {
      Log(spdlog::level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Warn(fmt::format_string<Args...> format, Args&&... args) const
    {
      Log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Error(fmt::format_string<Args...> format, Args&&... args) const
    {
      Log(spdlog::level::err, format, std::forward<Args>(args)...);
    }
  };
}

#endif
