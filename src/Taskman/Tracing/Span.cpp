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

#include <Taskman/Tracing/Span.hpp>
#include <boost/core/demangle.hpp>
#include <typeinfo>
#include <utility>

namespace Taskman
{
  Span::Span(std::string name, SpanContext context, std::optional<std::string> parentSpanId, SpanAttributes attributes, EndCallback onEnd)
    : m_name(std::move(name))
    , m_context(std::move(context))
    , m_parentSpanId(std::move(parentSpanId))
    , m_startTime(SpanClock::now())
    , m_attributes(std::move(attributes))
    , m_onEnd(std::move(onEnd))
  {
  }

  std::shared_ptr<Span> Span::CreateNoop()
  {
    auto span = std::make_shared<Span>("no-op", SpanContext{}, std::nullopt, SpanAttributes{});
    span->End();
    return span;
  }

  bool Span::IsRecording() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_recording;
  }

  std::optional<SpanClock::time_point> Span::GetEndTime() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endTime;
  }

  std::chrono::milliseconds Span::GetDuration() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto endTime = m_endTime.value_or(SpanClock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(endTime - m_startTime);
  }

  void Span::SetAttribute(std::string_view key, AttributeValue value)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_recording)
    {
      m_attributes.insert_or_assign(std::string(key), std::move(value));
    }
  }

  void Span::SetAttributes(const SpanAttributes& attributes)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_recording)
    {
      for (const auto& [key, value] : attributes)
      {
        m_attributes.insert_or_assign(key, value);
      }
    }
  }

  void Span::AddEvent(std::string name, SpanAttributes attributes)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_recording)
    {
      m_events.push_back(SpanEvent{std::move(name), SpanClock::now(), std::move(attributes)});
    }
  }

  void Span::RecordException(RecordedException exception, const SpanAttributes& attributes)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_recording)
    {
      return;
    }

    SpanAttributes eventAttributes = attributes;
    eventAttributes.insert_or_assign("exception.type", exception.Type);
    eventAttributes.insert_or_assign("exception.message", exception.Message);
    eventAttributes.insert_or_assign("exception.stacktrace", exception.Stack);
    m_events.push_back(SpanEvent{"exception", SpanClock::now(), std::move(eventAttributes)});
    m_exceptions.push_back(std::move(exception));
  }

  void Span::SetStatus(SpanStatus status)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_recording)
    {
      m_status = std::move(status);
    }
  }

  void Span::End()
  {
    EndCallback onEnd;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (!m_recording)
      {
        return;
      }
      m_recording = false;
      m_endTime = SpanClock::now();
      onEnd = std::move(m_onEnd);
    }
    if (onEnd)
    {
      onEnd(shared_from_this());
    }
  }

  SpanAttributes Span::GetAttributes() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attributes;
  }

  std::optional<AttributeValue> Span::GetAttribute(std::string_view key) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto itrFind = m_attributes.find(std::string(key));
    if (itrFind == m_attributes.end())
    {
      return std::nullopt;
    }
    return itrFind->second;
  }

  std::vector<SpanEvent> Span::GetEvents() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
  }

  std::vector<RecordedException> Span::GetExceptions() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_exceptions;
  }

  SpanStatus Span::GetStatus() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
  }

  RecordedException DescribeException(const std::exception_ptr& exception)
  {
    RecordedException result;
    if (!exception)
    {
      result.Type = "unknown";
      result.Message = "No exception";
      return result;
    }
    try
    {
      std::rethrow_exception(exception);
    }
    catch (const std::exception& ex)
    {
      result.Type = boost::core::demangle(typeid(ex).name());
      result.Message = ex.what();
    }
    catch (...)
    {
      result.Type = "unknown";
      result.Message = "Unknown exception";
    }
    return result;
  }
}
