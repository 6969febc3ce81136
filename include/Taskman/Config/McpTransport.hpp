#ifndef TASKMAN_CONFIG_MCPTRANSPORT_HPP
#define TASKMAN_CONFIG_MCPTRANSPORT_HPP
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

#include <optional>
#include <string_view>

namespace Taskman
{
  /// @brief How protocol payloads reach the server.
  enum class McpTransport
  {
    /// Newline delimited messages on stdin/stdout. stdout belongs to the protocol.
    Stdio,
    Http
  };

  constexpr std::string_view ToString(const McpTransport value) noexcept
  {
    switch (value)
    {
    case McpTransport::Stdio:
      return "stdio";
    case McpTransport::Http:
      return "http";
    }
    return "unknown";
  }

  constexpr std::optional<McpTransport> TryParseMcpTransport(const std::string_view value) noexcept
  {
    if (value == "stdio")
    {
      return McpTransport::Stdio;
    }
    if (value == "http")
    {
      return McpTransport::Http;
    }
    return std::nullopt;
  }
}

#endif
