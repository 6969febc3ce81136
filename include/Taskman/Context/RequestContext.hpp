#ifndef TASKMAN_CONTEXT_REQUESTCONTEXT_HPP
#define TASKMAN_CONTEXT_REQUESTCONTEXT_HPP
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

#include <Taskman/Context/RequestMetadata.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Taskman
{
  using RequestClock = std::chrono::steady_clock;

  /// @brief Identity and bookkeeping of one inbound request.
  struct RequestContext
  {
    std::string RequestId;
    std::optional<std::string> CorrelationId;
    RequestClock::time_point StartTime;
    /// Only changed through RequestContextStore::UpdateMetadata by the task that owns the context.
    RequestMetadata Metadata;
  };

  /// @brief What the caller supplies when opening a context; missing fields get defaults.
  struct PartialRequestContext
  {
    std::optional<std::string> RequestId;
    std::optional<std::string> CorrelationId;
    std::optional<RequestClock::time_point> StartTime;
    RequestMetadata Metadata;
  };

  struct RequestContextStats
  {
    std::string RequestId;
    std::optional<std::string> CorrelationId;
    std::chrono::milliseconds Duration{0};
    bool HasMetadata{false};
    std::vector<std::string> MetadataKeys;
  };
}

#endif
