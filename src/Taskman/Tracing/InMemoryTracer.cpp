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

#include <Taskman/Common/SpdLogHelper.hpp>
#include <Taskman/Tracing/InMemoryTracer.hpp>
#include <Taskman/Tracing/SemanticAttributes.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <fmt/format.h>
#include <iterator>
#include <optional>
#include <utility>

namespace Taskman
{
  namespace
  {
    std::string ToHex(const boost::uuids::uuid& id, const std::size_t byteCount)
    {
      std::string result;
      result.reserve(byteCount * 2);
      for (std::size_t i = 0; i < byteCount; ++i)
      {
        fmt::format_to(std::back_inserter(result), "{:02x}", static_cast<unsigned>(id.data[i]));
      }
      return result;
    }

    boost::uuids::uuid NextRandomId()
    {
      thread_local boost::uuids::random_generator generator;
      return generator();
    }
  }

  InMemoryTracer::InMemoryTracer(std::string serviceName, std::string serviceVersion, const std::size_t maxFinishedSpans)
    : m_serviceName(std::move(serviceName))
    , m_serviceVersion(std::move(serviceVersion))
    , m_maxFinishedSpans(maxFinishedSpans)
    , m_state(std::make_shared<State>())
    , m_logger(SpdLogHelper::GetLogger("Tracing"))
  {
  }

  std::shared_ptr<Span> InMemoryTracer::StartSpan(const std::string& name, const SpanAttributes& attributes, const std::shared_ptr<const Span>& parent)
  {
    SpanContext context;
    std::optional<std::string> parentSpanId;
    if (parent && parent->GetContext().IsValid())
    {
      context.TraceId = parent->GetContext().TraceId;
      parentSpanId = parent->GetContext().SpanId;
    }
    else
    {
      context.TraceId = ToHex(NextRandomId(), 16);
    }
    context.SpanId = ToHex(NextRandomId(), 8);

    SpanAttributes spanAttributes = attributes;
    spanAttributes.emplace(SemanticAttributes::ServiceName, m_serviceName);
    spanAttributes.emplace(SemanticAttributes::ServiceVersion, m_serviceVersion);

    // The exporter must not keep the tracer alive and must survive it
    std::weak_ptr<State> weakState = m_state;
    auto logger = m_logger;
    const auto maxFinishedSpans = m_maxFinishedSpans;
    auto onEnd = [weakState, logger, maxFinishedSpans](const std::shared_ptr<const Span>& span)
    {
      logger->debug("Span ended: name={} trace_id={} span_id={} status={} duration={}ms", span->GetName(), span->GetContext().TraceId,
                    span->GetContext().SpanId, ToString(span->GetStatus().Code), span->GetDuration().count());
      if (auto state = weakState.lock())
      {
        std::lock_guard<std::mutex> lock(state->Mutex);
        if (maxFinishedSpans > 0 && state->FinishedSpans.size() >= maxFinishedSpans)
        {
          state->FinishedSpans.erase(state->FinishedSpans.begin());
        }
        state->FinishedSpans.push_back(span);
      }
    };

    return std::make_shared<Span>(name, std::move(context), std::move(parentSpanId), std::move(spanAttributes), std::move(onEnd));
  }

  std::vector<std::shared_ptr<const Span>> InMemoryTracer::GetFinishedSpans() const
  {
    std::lock_guard<std::mutex> lock(m_state->Mutex);
    return m_state->FinishedSpans;
  }

  std::shared_ptr<const Span> InMemoryTracer::FindFinishedSpan(const std::string& name) const
  {
    std::lock_guard<std::mutex> lock(m_state->Mutex);
    for (auto itr = m_state->FinishedSpans.rbegin(); itr != m_state->FinishedSpans.rend(); ++itr)
    {
      if ((*itr)->GetName() == name)
      {
        return *itr;
      }
    }
    return nullptr;
  }

  void InMemoryTracer::Clear()
  {
    std::lock_guard<std::mutex> lock(m_state->Mutex);
    m_state->FinishedSpans.clear();
  }
}
