#ifndef TASKMAN_TIMEOUT_TIMEOUTGUARD_HPP
#define TASKMAN_TIMEOUT_TIMEOUTGUARD_HPP
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
#include <Taskman/Async/CompletionSignal.hpp>
#include <Taskman/Exception/TimeoutException.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace Taskman
{
  namespace Internal
  {
    template <typename T>
    struct TimeoutRaceResult
    {
      std::optional<T> Value;

      template <typename Operation>
      boost::asio::awaitable<void> Run(Operation& operation)
      {
        auto value = co_await operation();
        Value.emplace(std::move(value));
      }

      T Take()
      {
        return std::move(*Value);
      }
    };

    template <>
    struct TimeoutRaceResult<void>
    {
      template <typename Operation>
      boost::asio::awaitable<void> Run(Operation& operation)
      {
        co_await operation();
      }

      void Take()
      {
      }
    };

    /// @brief Shared between the caller, the operation task and the deadline task.
    template <typename T>
    struct TimeoutRace
    {
      Async::CompletionSignal Settled;
      boost::asio::steady_timer Deadline;
      TimeoutRaceResult<T> Result;
      std::exception_ptr Error;
      bool TimedOut{false};

      explicit TimeoutRace(const boost::asio::any_io_executor& executor)
        : Settled(executor)
        , Deadline(Async::UnwrapAmbientExecutor(executor))
      {
      }
    };
  }


  /// @brief Awaits @p operation for at most @p timeout.
  ///
  /// The operation is started as a child task on the caller's executor (inheriting the caller's ambient
  /// state) and raced against a steady timer.
  /// - Operation settles first: its value or exception is passed through unchanged.
  /// - Timer fires first: TimeoutException naming @p operationName and @p timeout is thrown. The operation
  ///   is not cancelled, it keeps running and its eventual outcome is discarded.
  ///
  /// The operation task is scheduled before the deadline task, so with a zero timeout an operation that
  /// finishes without suspending still wins. Anything that suspends loses to a zero timeout.
  ///
  /// @param operation Callable returning boost::asio::awaitable<T>.
  template <typename Operation>
  auto WithTimeout(Operation operation, const std::chrono::milliseconds timeout, std::string operationName)
    -> boost::asio::awaitable<typename Async::IsAwaitable<std::invoke_result_t<Operation&>>::ValueType>
  {
    using ResultType = typename Async::IsAwaitable<std::invoke_result_t<Operation&>>::ValueType;
    using Race = Internal::TimeoutRace<ResultType>;

    auto executor = co_await boost::asio::this_coro::executor;
    auto race = std::make_shared<Race>(executor);

    boost::asio::co_spawn(
      executor,
      [race, operation = std::move(operation)]() mutable -> boost::asio::awaitable<void>
      {
        try
        {
          co_await race->Result.Run(operation);
        }
        catch (...)
        {
          race->Error = std::current_exception();
        }
        race->Settled.Set();
      },
      boost::asio::detached);

    boost::asio::co_spawn(
      executor,
      [race, timeout]() -> boost::asio::awaitable<void>
      {
        if (race->Settled.IsSet())
        {
          co_return;
        }
        race->Deadline.expires_after(timeout);
        boost::system::error_code ec;
        co_await race->Deadline.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (!ec && !race->Settled.IsSet())
        {
          race->TimedOut = true;
          race->Settled.Set();
        }
      },
      boost::asio::detached);

    co_await race->Settled.WaitAsync();

    if (race->TimedOut)
    {
      throw TimeoutException(std::move(operationName), timeout);
    }
    race->Deadline.cancel();
    if (race->Error)
    {
      std::rethrow_exception(race->Error);
    }
    co_return race->Result.Take();
  }

  /// @brief Awaitable overload of WithTimeout for an operation that has already been created.
  template <typename T>
  boost::asio::awaitable<T> WithTimeout(boost::asio::awaitable<T> operation, const std::chrono::milliseconds timeout, std::string operationName)
  {
    auto holder = std::make_shared<boost::asio::awaitable<T>>(std::move(operation));
    auto resume = [holder]() { return std::move(*holder); };
    co_return co_await WithTimeout(std::move(resume), timeout, std::move(operationName));
  }


  /// @brief Reusable timeout policy created by CreateTimeoutWrapper.
  class TimeoutWrapper
  {
    std::chrono::milliseconds m_timeout;
    std::string m_operationName;

  public:
    TimeoutWrapper(const std::chrono::milliseconds timeout, std::string operationName)
      : m_timeout(timeout)
      , m_operationName(std::move(operationName))
    {
    }

    std::chrono::milliseconds GetTimeout() const noexcept
    {
      return m_timeout;
    }

    const std::string& GetOperationName() const noexcept
    {
      return m_operationName;
    }

    template <typename Operation>
    auto operator()(Operation operation) const
    {
      return WithTimeout(std::move(operation), m_timeout, m_operationName);
    }
  };

  inline TimeoutWrapper CreateTimeoutWrapper(const std::chrono::milliseconds timeout, std::string operationName)
  {
    return TimeoutWrapper(timeout, std::move(operationName));
  }
}

#endif
