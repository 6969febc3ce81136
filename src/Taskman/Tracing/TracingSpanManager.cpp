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
#include <Taskman/Tracing/SemanticAttributes.hpp>
#include <Taskman/Tracing/TracingSpanManager.hpp>
#include <boost/core/demangle.hpp>
#include <stdexcept>
#include <typeinfo>

namespace Taskman
{
  namespace
  {
    void ApplyException(Span& span, RecordedException exception, const SpanAttributes& attributes)
    {
      SpanAttributes errorAttributes = attributes;
      errorAttributes.insert_or_assign(std::string(SemanticAttributes::ErrorType), exception.Type);
      errorAttributes.insert_or_assign(std::string(SemanticAttributes::ErrorMessage), exception.Message);
      errorAttributes.insert_or_assign(std::string(SemanticAttributes::ErrorStack), exception.Stack);

      span.RecordException(std::move(exception), attributes);
      span.SetAttributes(errorAttributes);
    }
  }

  TracingSpanManager::TracingSpanManager(std::shared_ptr<ITracer> tracer)
    : m_tracer(std::move(tracer))
    , m_noopSpan(Span::CreateNoop())
    , m_logger(SpdLogHelper::GetLogger("Tracing"))
  {
    if (!m_tracer)
    {
      throw std::invalid_argument("TracingSpanManager: tracer can not be null");
    }
  }

  std::shared_ptr<Span> TracingSpanManager::CreateSpan(const std::string& name, const SpanAttributes& attributes) const
  {
    if (name.empty())
    {
      m_logger->warn("CreateSpan called with empty name");
    }

    SpanAttributes spanAttributes = attributes;
    spanAttributes.emplace(SemanticAttributes::OperationName, name);

    auto span = m_tracer->StartSpan(name, spanAttributes, m_activeSpan.Get());
    m_logger->debug("Span created: {} span_id={}", name, span->GetContext().SpanId);
    return span;
  }

  void TracingSpanManager::SetSpanAttribute(std::string_view key, AttributeValue value) const
  {
    auto span = GetActiveSpan();
    if (span && span->IsRecording())
    {
      m_logger->trace("Attribute set on span: {}={}", key, ToString(value));
      span->SetAttribute(key, std::move(value));
    }
  }

  void TracingSpanManager::SetSpanAttributes(const SpanAttributes& attributes) const
  {
    auto span = GetActiveSpan();
    if (span && span->IsRecording())
    {
      span->SetAttributes(attributes);
      m_logger->trace("Attributes set on span: count={}", attributes.size());
    }
  }

  void TracingSpanManager::AddSpanEvent(std::string name, SpanAttributes attributes) const
  {
    auto span = GetActiveSpan();
    if (span && span->IsRecording())
    {
      m_logger->trace("Event added to span: {}", name);
      span->AddEvent(std::move(name), std::move(attributes));
    }
  }

  void TracingSpanManager::RecordException(const std::exception_ptr& exception, const SpanAttributes& attributes) const
  {
    auto span = GetActiveSpan();
    if (span && span->IsRecording())
    {
      auto recorded = DescribeException(exception);
      m_logger->debug("Exception recorded in span: {}: {}", recorded.Type, recorded.Message);
      ApplyException(*span, std::move(recorded), attributes);
    }
  }

  void TracingSpanManager::RecordException(const std::exception& exception, const SpanAttributes& attributes) const
  {
    auto span = GetActiveSpan();
    if (span && span->IsRecording())
    {
      RecordedException recorded;
      recorded.Type = boost::core::demangle(typeid(exception).name());
      recorded.Message = exception.what();
      m_logger->debug("Exception recorded in span: {}: {}", recorded.Type, recorded.Message);
      ApplyException(*span, std::move(recorded), attributes);
    }
  }

  void TracingSpanManager::SetSpanStatus(SpanStatus status) const
  {
    auto span = GetActiveSpan();
    if (span && span->IsRecording())
    {
      m_logger->trace("Span status set: {}", ToString(status.Code));
      span->SetStatus(std::move(status));
    }
  }

  ContextLogger TracingSpanManager::WithTraceLogger(const ContextLogger& baseLogger) const
  {
    auto span = GetActiveSpan();
    if (!span || !span->GetContext().IsValid())
    {
      return baseLogger;
    }
    return baseLogger.With("trace_id", span->GetContext().TraceId).With("span_id", span->GetContext().SpanId);
  }

  void TracingSpanManager::MarkFailed(Span& span, const std::exception_ptr& error)
  {
    auto recorded = DescribeException(error);
    std::string message = recorded.Message;
    span.RecordException(std::move(recorded));
    span.SetStatus(SpanStatus{SpanStatusCode::Error, std::move(message)});
  }

  void TracingSpanManager::RecordOperationOutcome(Span& span, const std::chrono::steady_clock::time_point startTime, const bool succeeded)
  {
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    span.SetAttribute(SemanticAttributes::OperationDurationMs, static_cast<std::int64_t>(duration.count()));
    span.SetAttribute(SemanticAttributes::OperationStatus, std::string(succeeded ? "success" : "error"));
  }
}
