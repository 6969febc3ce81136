#ifndef TASKMAN_TRACING_SPAN_HPP
#define TASKMAN_TRACING_SPAN_HPP
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

#include <Taskman/Tracing/SpanTypes.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Taskman
{
  /// @brief Identifies a span within a trace.
  struct SpanContext
  {
    std::string TraceId;
    std::string SpanId;

    bool IsValid() const noexcept
    {
      return !TraceId.empty() && !SpanId.empty();
    }
  };

  /// @brief One traced unit of work.
  ///
  /// A span starts out recording and moves to ended exactly once. Attributes, events, status and
  /// exceptions can only be added while it is recording; afterwards every mutation is silently ignored
  /// and the span is immutable. All members are thread safe.
  class Span : public std::enable_shared_from_this<Span>
  {
  public:
    /// @brief Invoked once when the span ends, with the lock released.
    using EndCallback = std::function<void(const std::shared_ptr<const Span>&)>;

  private:
    mutable std::mutex m_mutex;
    std::string m_name;
    SpanContext m_context;
    std::optional<std::string> m_parentSpanId;
    SpanClock::time_point m_startTime;
    std::optional<SpanClock::time_point> m_endTime;
    SpanAttributes m_attributes;
    std::vector<SpanEvent> m_events;
    std::vector<RecordedException> m_exceptions;
    SpanStatus m_status;
    bool m_recording{true};
    EndCallback m_onEnd;

  public:
    Span(std::string name, SpanContext context, std::optional<std::string> parentSpanId, SpanAttributes attributes, EndCallback onEnd = {});

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;
    Span(Span&&) = delete;
    Span& operator=(Span&&) = delete;

    /// @brief An already ended span with an invalid context. Every mutation on it is ignored.
    static std::shared_ptr<Span> CreateNoop();

    const std::string& GetName() const noexcept
    {
      return m_name;
    }

    const SpanContext& GetContext() const noexcept
    {
      return m_context;
    }

    const std::optional<std::string>& GetParentSpanId() const noexcept
    {
      return m_parentSpanId;
    }

    SpanClock::time_point GetStartTime() const noexcept
    {
      return m_startTime;
    }

    bool IsRecording() const;

    std::optional<SpanClock::time_point> GetEndTime() const;

    /// @brief Time from start to end, or to now while the span is still recording.
    std::chrono::milliseconds GetDuration() const;

    void SetAttribute(std::string_view key, AttributeValue value);
    void SetAttributes(const SpanAttributes& attributes);
    void AddEvent(std::string name, SpanAttributes attributes = {});
    /// @brief Stores @p exception and adds the matching "exception" event.
    void RecordException(RecordedException exception, const SpanAttributes& attributes = {});
    void SetStatus(SpanStatus status);

    /// @brief Moves the span to ended. Only the first call has an effect.
    void End();

    SpanAttributes GetAttributes() const;
    std::optional<AttributeValue> GetAttribute(std::string_view key) const;
    std::vector<SpanEvent> GetEvents() const;
    std::vector<RecordedException> GetExceptions() const;
    SpanStatus GetStatus() const;
  };

  /// @brief Extracts type, message and stack from a captured exception.
  RecordedException DescribeException(const std::exception_ptr& exception);
}

#endif
