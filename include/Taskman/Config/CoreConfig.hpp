#ifndef TASKMAN_CONFIG_CORECONFIG_HPP
#define TASKMAN_CONFIG_CORECONFIG_HPP
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
#include <Taskman/Shutdown/ShutdownOrchestratorConfig.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace Taskman
{
  /// @brief Everything the server core needs to start. Defaults are usable as is.
  struct CoreConfig
  {
    static constexpr std::chrono::milliseconds DefaultToolTimeout{30000};
    static constexpr std::chrono::milliseconds DefaultBackendTimeout{10000};

    std::string ServiceName{"taskman-mcp"};
    std::string ServiceVersion{"0.1.0"};
    std::string Environment{"development"};
    /// LoadCoreConfig fills BaseFields with the service, environment and version.
    LoggingConfig Logging;
    ShutdownOrchestratorConfig Shutdown;
    /// Deadline for one tool invocation.
    std::chrono::milliseconds ToolTimeout{DefaultToolTimeout};
    /// Deadline for one outbound backend call.
    std::chrono::milliseconds BackendTimeout{DefaultBackendTimeout};
  };

  /// @brief Looks up one variable; nullopt when it is not set.
  using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

  namespace EnvironmentVariables
  {
    inline constexpr const char* Transport = "TASKMAN_MCP_TRANSPORT";
    inline constexpr const char* LogLevel = "LOG_LEVEL";
    inline constexpr const char* ShutdownTimeoutMs = "TASKMAN_SHUTDOWN_TIMEOUT_MS";
    inline constexpr const char* ToolTimeoutMs = "TASKMAN_TOOL_TIMEOUT_MS";
    inline constexpr const char* BackendTimeoutMs = "TASKMAN_BACKEND_TIMEOUT_MS";
    inline constexpr const char* ServiceName = "TASKMAN_SERVICE_NAME";
    inline constexpr const char* Environment = "TASKMAN_ENVIRONMENT";
  }

  /// @brief Builds a CoreConfig from the defaults overridden by the variables @p lookup knows about.
  /// @throws ConfigurationException if a variable is set to an unusable value.
  CoreConfig LoadCoreConfig(const EnvironmentLookup& lookup);

  /// @brief LoadCoreConfig on the process environment.
  CoreConfig LoadCoreConfigFromEnvironment();

  /// @brief Parses a log level name (trace, debug, info, warn, error, fatal/critical, silent/off).
  std::optional<spdlog::level::level_enum> TryParseLogLevel(const std::string& value);
}

#endif
