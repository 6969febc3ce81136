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

#include <Taskman/Context/RequestContextStore.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

namespace Taskman
{
  namespace
  {
    std::string GenerateRequestId()
    {
      thread_local boost::uuids::random_generator generator;
      return fmt::format("req-{}", boost::uuids::to_string(generator()));
    }

    std::chrono::milliseconds ElapsedSince(const RequestClock::time_point startTime)
    {
      return std::chrono::duration_cast<std::chrono::milliseconds>(RequestClock::now() - startTime);
    }
  }

  std::shared_ptr<RequestContext> RequestContextStore::CreateContext(PartialRequestContext partial)
  {
    auto context = std::make_shared<RequestContext>();
    context->RequestId = partial.RequestId && !partial.RequestId->empty() ? std::move(*partial.RequestId) : GenerateRequestId();
    context->CorrelationId = std::move(partial.CorrelationId);
    context->StartTime = partial.StartTime.value_or(RequestClock::now());
    context->Metadata = std::move(partial.Metadata);
    return context;
  }

  std::optional<std::string> RequestContextStore::GetRequestId() const
  {
    if (auto context = GetContext())
    {
      return context->RequestId;
    }
    return std::nullopt;
  }

  std::optional<std::string> RequestContextStore::GetCorrelationId() const
  {
    if (auto context = GetContext())
    {
      return context->CorrelationId;
    }
    return std::nullopt;
  }

  std::optional<std::chrono::milliseconds> RequestContextStore::GetRequestDuration() const
  {
    if (auto context = GetContext())
    {
      return ElapsedSince(context->StartTime);
    }
    return std::nullopt;
  }

  std::optional<RequestContextStats> RequestContextStore::GetContextStats() const
  {
    auto context = GetContext();
    if (!context)
    {
      return std::nullopt;
    }

    RequestContextStats stats;
    stats.RequestId = context->RequestId;
    stats.CorrelationId = context->CorrelationId;
    stats.Duration = ElapsedSince(context->StartTime);
    stats.HasMetadata = !context->Metadata.IsEmpty();
    stats.MetadataKeys = context->Metadata.GetKeys();
    return stats;
  }

  void RequestContextStore::UpdateMetadata(const RequestMetadata& patch) const
  {
    if (auto context = m_slot.Get())
    {
      context->Metadata.Merge(patch);
    }
  }

  ContextLogger RequestContextStore::WithRequestLogger(const ContextLogger& baseLogger) const
  {
    auto context = GetContext();
    if (!context)
    {
      return baseLogger;
    }

    auto logger = baseLogger.With("requestId", context->RequestId);
    if (context->CorrelationId)
    {
      logger = logger.With("correlationId", *context->CorrelationId);
    }
    return logger;
  }
}
