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
#include <Taskman/Logging/LogSetup.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace Taskman
{
  namespace
  {
    void AppendEscaped(std::string& rDst, std::string_view text)
    {
      for (const char ch : text)
      {
        if (ch == '%')
        {
          rDst += "%%";
        }
        else
        {
          rDst += ch;
        }
      }
    }
  }


  std::string BuildLogPattern(const LoggingConfig& config)
  {
    std::string pattern(config.Pattern);
    for (const auto& field : config.BaseFields)
    {
      pattern += ' ';
      AppendEscaped(pattern, field.first);
      pattern += '=';
      AppendEscaped(pattern, LogRedaction::MaskValue(field.first, field.second));
    }
    return pattern;
  }


  std::shared_ptr<spdlog::logger> ConfigureLogging(const LoggingConfig& config, const std::string& name)
  {
    spdlog::sink_ptr sink;
    if (config.Transport == McpTransport::Stdio)
    {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else
    {
      sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }

    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern(BuildLogPattern(config));
    logger->set_level(config.Level);

    spdlog::drop_all();
    spdlog::set_default_logger(logger);
    spdlog::debug("Logging configured: transport={}, level={}", ToString(config.Transport), spdlog::level::to_string_view(config.Level));
    return logger;
  }
}
