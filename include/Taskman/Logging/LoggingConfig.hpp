#ifndef TASKMAN_LOGGING_LOGGINGCONFIG_HPP
#define TASKMAN_LOGGING_LOGGINGCONFIG_HPP
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

#include <Taskman/Config/McpTransport.hpp>
#include <spdlog/common.h>
#include <string>
#include <utility>
#include <vector>

namespace Taskman
{
  struct LoggingConfig
  {
    static constexpr const char* DefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    spdlog::level::level_enum Level{spdlog::level::info};
    /// Selects the sink. Stdio keeps stdout free for protocol payloads.
    McpTransport Transport{McpTransport::Stdio};
    std::string Pattern{DefaultPattern};
    /// Appended as " key=value" to every record in binding order. Sensitive values are masked.
    std::vector<std::pair<std::string, std::string>> BaseFields;
  };
}

#endif
