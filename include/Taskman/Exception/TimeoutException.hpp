#ifndef TASKMAN_EXCEPTION_TIMEOUTEXCEPTION_HPP
#define TASKMAN_EXCEPTION_TIMEOUTEXCEPTION_HPP
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

#include <fmt/format.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace Taskman
{
  /// @brief Exception thrown when an operation did not settle before its deadline.
  ///
  /// The guarded operation is not cancelled, it is simply no longer awaited. Timeouts are always
  /// considered retryable; whether to retry is up to the caller.
  class TimeoutException : public std::runtime_error
  {
    std::string m_operationName;
    std::chrono::milliseconds m_timeout;

  public:
    static constexpr std::string_view Code = "TIMEOUT";

    TimeoutException(std::string operationName, const std::chrono::milliseconds timeout)
      : std::runtime_error(fmt::format("Operation '{}' timed out after {}ms", operationName, timeout.count()))
      , m_operationName(std::move(operationName))
      , m_timeout(timeout)
    {
    }

    const std::string& GetOperationName() const noexcept
    {
      return m_operationName;
    }

    std::chrono::milliseconds GetTimeout() const noexcept
    {
      return m_timeout;
    }

    long long GetTimeoutMs() const noexcept
    {
      return m_timeout.count();
    }

    bool IsRetryable() const noexcept
    {
      return true;
    }

    std::string_view GetCode() const noexcept
    {
      return Code;
    }
  };
}

#endif
