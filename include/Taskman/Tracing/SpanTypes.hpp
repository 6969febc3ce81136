#ifndef TASKMAN_TRACING_SPANTYPES_HPP
#define TASKMAN_TRACING_SPANTYPES_HPP
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

#include <Taskman/Common/ScalarValue.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Taskman
{
  using AttributeValue = ScalarValue;
  using SpanAttributes = std::map<std::string, AttributeValue>;
  using SpanClock = std::chrono::system_clock;

  enum class SpanStatusCode
  {
    Unset,
    Ok,
    Error
  };

  constexpr std::string_view ToString(const SpanStatusCode value) noexcept
  {
    switch (value)
    {
    case SpanStatusCode::Unset:
      return "unset";
    case SpanStatusCode::Ok:
      return "ok";
    case SpanStatusCode::Error:
      return "error";
    }
    return "unknown";
  }

  struct SpanStatus
  {
    SpanStatusCode Code{SpanStatusCode::Unset};
    std::optional<std::string> Message;

    bool operator==(const SpanStatus& rhs) const = default;
  };

  struct SpanEvent
  {
    std::string Name;
    SpanClock::time_point Timestamp;
    SpanAttributes Attributes;
  };

  /// @brief A failure captured on a span.
  struct RecordedException
  {
    static constexpr const char* NoStackTrace = "(no stack trace)";

    std::string Type;
    std::string Message;
    std::string Stack{NoStackTrace};
  };
}

#endif
