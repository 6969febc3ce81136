#ifndef TASKMAN_TRACING_TRACINGSPANMANAGER_HPP
#define TASKMAN_TRACING_TRACINGSPANMANAGER_HPP
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

#include <Taskman/Async/AmbientSpawn.hpp>
#include <Taskman/Async/AmbientState.hpp>
#include <Taskman/Logging/ContextLogger.hpp>
#include <Taskman/Tracing/ITracer.hpp>
#include <Taskman/Tracing/Span.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <spdlog/logger.h>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace Taskman
{
  namespace Internal
  {
    /// Span callbacks may take the span or nothing at all.
    template <typename Func>
    decltype(auto) InvokeWithSpan(Func& func, Span& span)
    {
      if constexpr (std::is_invocable_v<Func&, Span&>)
      {
        return func(span);
      }
      else
      {
        return func();
      }
    }

    template <typename Func>
    using SpanInvokeResultT = decltype(InvokeWithSpan(std::declval<Func&>(), std::declval<Span&>()));

    template <typename Func>
    using SpanAwaitableValueT = typename Async::IsAwaitable<SpanInvokeResultT<Func>>::ValueType;

    /// Ends the span when the scope is left, on every path.
    class SpanEndGuard
    {
      std::shared_ptr<Span> m_span;

    public:
      explicit SpanEndGuard(std::shared_ptr<Span> span)
        : m_span(std::move(span))
      {
      }

      ~SpanEndGuard()
      {
        m_span->End();
      }

      SpanEndGuard(const SpanEndGuard&) = delete;
      SpanEndGuard& operator=(const SpanEndGuard&) = delete;
    };
  }


  /// @brief Creates spans and tracks the active span of the running task.
  ///
  /// The active span is ambient state in the same way as the request context: it follows the logical
  /// task across suspension points and into child tasks, and nested WithSpan calls restore the outer
  /// span when they return. Spans created while another span is active become its children.
  ///
  /// The Set/Add/Record helpers act on the active span and do nothing when there is none or when it has
  /// already ended, so callers never need to check.
  class TracingSpanManager
  {
    std::shared_ptr<ITracer> m_tracer;
    std::shared_ptr<Span> m_noopSpan;
    std::shared_ptr<spdlog::logger> m_logger;
    Async::AmbientSlot<Span> m_activeSpan;

  public:
    explicit TracingSpanManager(std::shared_ptr<ITracer> tracer);

    TracingSpanManager(const TracingSpanManager&) = delete;
    TracingSpanManager& operator=(const TracingSpanManager&) = delete;

    const std::shared_ptr<ITracer>& GetTracer() const noexcept
    {
      return m_tracer;
    }

    /// @brief Starts a recording span tagged with operation.name. The caller must End() it.
    std::shared_ptr<Span> CreateSpan(const std::string& name, const SpanAttributes& attributes = {}) const;

    /// @brief The active span or nullptr.
    std::shared_ptr<Span> GetActiveSpan() const noexcept
    {
      return m_activeSpan.Get();
    }

    /// @brief The active span or an ended no-op span. Never nullptr.
    std::shared_ptr<Span> GetCurrentSpan() const noexcept
    {
      auto span = m_activeSpan.Get();
      return span ? span : m_noopSpan;
    }

    /// @brief Runs the synchronous @p func inside a new span.
    ///
    /// On success the span is ended. On failure the exception is recorded, the status is set to error
    /// with the exception message, the span is ended and the original exception is rethrown.
    /// @param func Callable taking Span& (or nothing).
    template <typename Func>
    auto WithSpan(const std::string& name, const SpanAttributes& attributes, Func&& func) -> Internal::SpanInvokeResultT<Func>
    {
      auto span = CreateSpan(name, attributes);
      Internal::SpanEndGuard endGuard(span);
      Async::AmbientScope scope(m_activeSpan.Bind(span));
      try
      {
        return Internal::InvokeWithSpan(func, *span);
      }
      catch (...)
      {
        MarkFailed(*span, std::current_exception());
        throw;
      }
    }

    template <typename Func>
    auto WithSpan(const std::string& name, Func&& func) -> Internal::SpanInvokeResultT<Func>
    {
      return WithSpan(name, SpanAttributes{}, std::forward<Func>(func));
    }

    /// @brief Coroutine version of WithSpan. @p func returns boost::asio::awaitable<T> and runs as a child task.
    template <typename Func>
    auto WithSpanAsync(std::string name, SpanAttributes attributes, Func func) -> boost::asio::awaitable<Internal::SpanAwaitableValueT<Func>>
    {
      auto span = CreateSpan(name, attributes);
      co_return co_await RunInSpanAsync(std::move(span), std::move(func));
    }

    template <typename Func>
    auto WithSpanAsync(std::string name, Func func) -> boost::asio::awaitable<Internal::SpanAwaitableValueT<Func>>
    {
      return WithSpanAsync(std::move(name), SpanAttributes{}, std::move(func));
    }

    /// @brief Makes an existing span the active one while @p func runs. The span is not ended.
    template <typename Func>
    auto WithActiveSpan(std::shared_ptr<Span> span, Func&& func) -> std::invoke_result_t<Func&&>
    {
      Async::AmbientScope scope(m_activeSpan.Bind(std::move(span)));
      return std::forward<Func>(func)();
    }

    template <typename Func>
    auto WithActiveSpanAsync(std::shared_ptr<Span> span, Func func)
    {
      return Async::RunWithAmbientAsync(m_activeSpan.Bind(std::move(span)), std::move(func));
    }

    void SetSpanAttribute(std::string_view key, AttributeValue value) const;
    void SetSpanAttributes(const SpanAttributes& attributes) const;
    void AddSpanEvent(std::string name, SpanAttributes attributes = {}) const;

    /// @brief Records @p exception on the active span and sets the error.type, error.message and error.stack attributes.
    ///        The status is left alone.
    void RecordException(const std::exception_ptr& exception, const SpanAttributes& attributes = {}) const;
    void RecordException(const std::exception& exception, const SpanAttributes& attributes = {}) const;

    void SetSpanStatus(SpanStatus status) const;

    /// @brief WithSpan that also records operation.duration_ms and operation.status ("success" or "error").
    /// @param func Callable taking no arguments.
    template <typename Func>
    auto MeasureOperation(const std::string& operationName, Func&& func, const SpanAttributes& attributes = {}) -> std::invoke_result_t<Func&>
    {
      return WithSpan(operationName, attributes,
                      [&func](Span& span) -> std::invoke_result_t<Func&>
                      {
                        const auto startTime = std::chrono::steady_clock::now();
                        try
                        {
                          if constexpr (std::is_void_v<std::invoke_result_t<Func&>>)
                          {
                            func();
                            RecordOperationOutcome(span, startTime, true);
                          }
                          else
                          {
                            auto result = func();
                            RecordOperationOutcome(span, startTime, true);
                            return result;
                          }
                        }
                        catch (...)
                        {
                          RecordOperationOutcome(span, startTime, false);
                          throw;
                        }
                      });
    }

    /// @brief Coroutine version of MeasureOperation. @p func returns boost::asio::awaitable<T>.
    template <typename Func>
    auto MeasureOperationAsync(std::string operationName, Func func, SpanAttributes attributes = {})
      -> boost::asio::awaitable<typename Async::IsAwaitable<std::invoke_result_t<Func&>>::ValueType>
    {
      using ResultType = typename Async::IsAwaitable<std::invoke_result_t<Func&>>::ValueType;
      auto measured = [func = std::move(func)](Span& span) mutable -> boost::asio::awaitable<ResultType>
      {
        const auto startTime = std::chrono::steady_clock::now();
        bool succeeded = false;
        std::exception_ptr error;
        if constexpr (std::is_void_v<ResultType>)
        {
          try
          {
            co_await func();
            succeeded = true;
          }
          catch (...)
          {
            error = std::current_exception();
          }
          RecordOperationOutcome(span, startTime, succeeded);
          if (error)
          {
            std::rethrow_exception(error);
          }
        }
        else
        {
          std::optional<ResultType> result;
          try
          {
            auto value = co_await func();
            result.emplace(std::move(value));
            succeeded = true;
          }
          catch (...)
          {
            error = std::current_exception();
          }
          RecordOperationOutcome(span, startTime, succeeded);
          if (error)
          {
            std::rethrow_exception(error);
          }
          co_return std::move(*result);
        }
      };
      co_return co_await WithSpanAsync(std::move(operationName), std::move(attributes), std::move(measured));
    }

    /// @brief @p baseLogger with trace_id and span_id of the active span bound, or @p baseLogger when no span is active.
    ContextLogger WithTraceLogger(const ContextLogger& baseLogger) const;

  private:
    template <typename Func>
    auto RunInSpanAsync(std::shared_ptr<Span> span, Func func) -> boost::asio::awaitable<Internal::SpanAwaitableValueT<Func>>
    {
      Internal::SpanEndGuard endGuard(span);
      auto state = m_activeSpan.Bind(span);
      auto body = [span, func = std::move(func)]() mutable { return Internal::InvokeWithSpan(func, *span); };
      std::exception_ptr error;
      try
      {
        co_return co_await Async::RunWithAmbientAsync(std::move(state), std::move(body));
      }
      catch (...)
      {
        error = std::current_exception();
      }
      MarkFailed(*span, error);
      std::rethrow_exception(error);
    }

    static void MarkFailed(Span& span, const std::exception_ptr& error);
    static void RecordOperationOutcome(Span& span, std::chrono::steady_clock::time_point startTime, bool succeeded);
  };
}

#endif
