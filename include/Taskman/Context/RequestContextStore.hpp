#ifndef TASKMAN_CONTEXT_REQUESTCONTEXTSTORE_HPP
#define TASKMAN_CONTEXT_REQUESTCONTEXTSTORE_HPP
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
#include <Taskman/Context/RequestContext.hpp>
#include <Taskman/Logging/ContextLogger.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace Taskman
{
  /// @brief Request scoped context that follows a request through everything it awaits.
  ///
  /// A context is opened with Run (synchronous callables) or RunAsync (coroutines). For the whole
  /// dynamic extent of the callable, including child tasks spawned from its executor, the accessors
  /// below observe that context. Outside any context they return empty values, they never throw.
  ///
  /// Contexts nest: an inner Run/RunAsync shadows the outer context until it returns, after which
  /// the outer context object itself is visible again. Concurrent requests never see each other's
  /// context because the context travels with the logical task, not with the thread.
  ///
  /// The store is a long-lived service owned by the host; several stores are fully independent.
  class RequestContextStore
  {
    Async::AmbientSlot<RequestContext> m_slot;

  public:
    RequestContextStore() = default;

    /// @brief Builds a full context from @p partial, generating "req-<uuid>" and taking "now" where needed.
    static std::shared_ptr<RequestContext> CreateContext(PartialRequestContext partial);

    /// @brief Runs the synchronous @p func with a new context active.
    /// @return Whatever @p func returns. Exceptions pass through unchanged.
    template <typename Func>
    auto Run(PartialRequestContext partial, Func&& func) -> std::invoke_result_t<Func&&>
    {
      Async::AmbientScope scope(m_slot.Bind(CreateContext(std::move(partial))));
      return std::forward<Func>(func)();
    }

    /// @brief Runs the coroutine produced by @p func as a child task with a new context active.
    /// @param func Callable returning boost::asio::awaitable<T>.
    template <typename Func>
    auto RunAsync(PartialRequestContext partial, Func func)
    {
      return Async::RunWithAmbientAsync(m_slot.Bind(CreateContext(std::move(partial))), std::move(func));
    }

    /// @brief The active context or nullptr.
    std::shared_ptr<const RequestContext> GetContext() const noexcept
    {
      return m_slot.Get();
    }

    bool HasContext() const noexcept
    {
      return GetContext() != nullptr;
    }

    std::optional<std::string> GetRequestId() const;

    std::optional<std::string> GetCorrelationId() const;

    /// @brief Time elapsed since the active context started.
    std::optional<std::chrono::milliseconds> GetRequestDuration() const;

    std::optional<RequestContextStats> GetContextStats() const;

    /// @brief Merges @p patch into the active context's metadata. Does nothing without a context.
    void UpdateMetadata(const RequestMetadata& patch) const;

    /// @brief @p baseLogger with requestId (and correlationId when set) bound, or @p baseLogger itself
    ///        when no context is active.
    ContextLogger WithRequestLogger(const ContextLogger& baseLogger) const;

    ContextLogger WithRequestLogger() const
    {
      return WithRequestLogger(ContextLogger());
    }
  };
}

#endif
