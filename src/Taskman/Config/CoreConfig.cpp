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

#include <Taskman/Config/CoreConfig.hpp>
#include <Taskman/Exception/ConfigurationException.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>

namespace Taskman
{
  namespace
  {
    std::string ToLower(std::string value)
    {
      std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
      return value;
    }

    std::chrono::milliseconds ParseTimeoutMs(const char* key, const std::string& value)
    {
      std::int64_t result = 0;
      const auto* const pEnd = value.data() + value.size();
      const auto [ptr, ec] = std::from_chars(value.data(), pEnd, result);
      if (ec != std::errc() || ptr != pEnd || value.empty())
      {
        throw ConfigurationException(key, value, "expected a whole number of milliseconds");
      }
      if (result <= 0)
      {
        throw ConfigurationException(key, value, "must be greater than zero");
      }
      return std::chrono::milliseconds(result);
    }
  }

  std::optional<spdlog::level::level_enum> TryParseLogLevel(const std::string& value)
  {
    const auto name = ToLower(value);
    if (name == "trace")
    {
      return spdlog::level::trace;
    }
    if (name == "debug")
    {
      return spdlog::level::debug;
    }
    if (name == "info")
    {
      return spdlog::level::info;
    }
    if (name == "warn" || name == "warning")
    {
      return spdlog::level::warn;
    }
    if (name == "error" || name == "err")
    {
      return spdlog::level::err;
    }
    if (name == "fatal" || name == "critical")
    {
      return spdlog::level::critical;
    }
    if (name == "silent" || name == "off")
    {
      return spdlog::level::off;
    }
    return std::nullopt;
  }

  CoreConfig LoadCoreConfig(const EnvironmentLookup& lookup)
  {
    CoreConfig config;

    if (auto value = lookup(EnvironmentVariables::Transport))
    {
      auto transport = TryParseMcpTransport(ToLower(*value));
      if (!transport)
      {
        throw ConfigurationException(EnvironmentVariables::Transport, *value, "expected 'stdio' or 'http'");
      }
      config.Logging.Transport = *transport;
    }

    if (auto value = lookup(EnvironmentVariables::LogLevel))
    {
      auto level = TryParseLogLevel(*value);
      if (!level)
      {
        throw ConfigurationException(EnvironmentVariables::LogLevel, *value, "unknown log level");
      }
      config.Logging.Level = *level;
    }

    if (auto value = lookup(EnvironmentVariables::ShutdownTimeoutMs))
    {
      config.Shutdown.Timeout = ParseTimeoutMs(EnvironmentVariables::ShutdownTimeoutMs, *value);
    }
    if (auto value = lookup(EnvironmentVariables::ToolTimeoutMs))
    {
      config.ToolTimeout = ParseTimeoutMs(EnvironmentVariables::ToolTimeoutMs, *value);
    }
    if (auto value = lookup(EnvironmentVariables::BackendTimeoutMs))
    {
      config.BackendTimeout = ParseTimeoutMs(EnvironmentVariables::BackendTimeoutMs, *value);
    }

    if (auto value = lookup(EnvironmentVariables::ServiceName))
    {
      if (value->empty())
      {
        throw ConfigurationException(EnvironmentVariables::ServiceName, *value, "can not be empty");
      }
      config.ServiceName = std::move(*value);
    }
    if (auto value = lookup(EnvironmentVariables::Environment))
    {
      if (value->empty())
      {
        throw ConfigurationException(EnvironmentVariables::Environment, *value, "can not be empty");
      }
      config.Environment = std::move(*value);
    }

    config.Logging.BaseFields = {
      {"service", config.ServiceName},
      {"environment", config.Environment},
      {"version", config.ServiceVersion},
    };
    return config;
  }

  CoreConfig LoadCoreConfigFromEnvironment()
  {
    return LoadCoreConfig(
      [](const std::string& name) -> std::optional<std::string>
      {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr)
        {
          return std::nullopt;
        }
        return std::string(value);
      });
  }
}
