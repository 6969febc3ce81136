#ifndef TASKMAN_SHUTDOWN_SHUTDOWNTYPES_HPP
#define TASKMAN_SHUTDOWN_SHUTDOWNTYPES_HPP
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

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Taskman
{
  using ShutdownClock = std::chrono::system_clock;

  /// @brief Releases one resource. May suspend and may throw.
  using CleanupFunction = std::function<boost::asio::awaitable<void>()>;

  struct ShutdownResource
  {
    std::string Name;
    CleanupFunction Cleanup;
  };

  /// @brief A cleanup that failed. Recorded, never rethrown.
  struct ShutdownCleanupError
  {
    std::string Resource;
    std::string Error;

    bool operator==(const ShutdownCleanupError& rhs) const = default;
  };

  struct ShutdownResourceTiming
  {
    std::string Resource;
    std::chrono::milliseconds Duration{0};
    bool Succeeded{false};

    bool operator==(const ShutdownResourceTiming& rhs) const = default;
  };

  /// @brief Outcome of the shutdown run. Final once EndTime is set.
  struct ShutdownStats
  {
    std::size_t ResourceCount{0};
    /// Resource names in registration order.
    std::vector<std::string> Resources;
    ShutdownClock::time_point StartTime;
    std::optional<ShutdownClock::time_point> EndTime;
    std::chrono::milliseconds Duration{0};
    std::vector<ShutdownCleanupError> Errors;
    /// One entry per cleanup that finished before the deadline, in cleanup order.
    std::vector<ShutdownResourceTiming> Timings;
    /// The global deadline elapsed before every cleanup had finished.
    bool TimedOut{false};

    bool HasErrors() const noexcept
    {
      return !Errors.empty();
    }

    bool operator==(const ShutdownStats& rhs) const = default;
  };
}

#endif
