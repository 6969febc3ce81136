#ifndef TASKMAN_ASYNC_AMBIENTSPAWN_HPP
#define TASKMAN_ASYNC_AMBIENTSPAWN_HPP
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

#include <Taskman/Async/AmbientExecutor.hpp>
#include <Taskman/Async/AmbientState.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace Taskman::Async
{
  template <typename T>
  struct IsAwaitable : std::false_type
  {
  };

  template <typename T, typename Executor>
  struct IsAwaitable<boost::asio::awaitable<T, Executor>> : std::true_type
  {
    using ValueType = T;
  };

  template <typename T>
  inline constexpr bool IsAwaitableV = IsAwaitable<std::decay_t<T>>::value;


  /// @brief Runs the awaitable produced by @p func as a child task with @p state installed.
  ///
  /// The child runs on the caller's executor (unwrapped from any previous ambient layer) and the caller
  /// is suspended until it finishes. The child's result or exception is passed through unchanged. When
  /// the child finishes, the caller is resumed through its own executor, so the caller's state is the
  /// one visible again.
  ///
  /// @param state The ambient state for the child's entire dynamic extent.
  /// @param func Callable returning boost::asio::awaitable<T>.
  template <typename Func>
  auto RunWithAmbientAsync(AmbientState state, Func func) -> boost::asio::awaitable<typename IsAwaitable<std::invoke_result_t<Func&>>::ValueType>
  {
    using ResultType = typename IsAwaitable<std::invoke_result_t<Func&>>::ValueType;

    const auto callerExecutor = co_await boost::asio::this_coro::executor;
    auto executor = MakeAmbientExecutor(callerExecutor, std::move(state));

    // co_spawn resumes the caller inline from inside the child's scope. Hopping through a post on the caller's
    // own executor puts the caller's state back before any of its code runs.
    std::exception_ptr error;
    if constexpr (std::is_void_v<ResultType>)
    {
      auto child = [func = std::move(func)]() mutable -> boost::asio::awaitable<void> { co_await func(); };
      try
      {
        co_await boost::asio::co_spawn(executor, std::move(child), boost::asio::use_awaitable);
      }
      catch (...)
      {
        error = std::current_exception();
      }
      co_await boost::asio::post(callerExecutor, boost::asio::use_awaitable);
      if (error)
      {
        std::rethrow_exception(error);
      }
    }
    else
    {
      // co_spawn needs a default constructible result type, so the value travels through the caller's frame
      std::optional<ResultType> result;
      auto child = [&result, func = std::move(func)]() mutable -> boost::asio::awaitable<void>
      {
        auto value = co_await func();
        result.emplace(std::move(value));
      };
      try
      {
        co_await boost::asio::co_spawn(executor, std::move(child), boost::asio::use_awaitable);
      }
      catch (...)
      {
        error = std::current_exception();
      }
      co_await boost::asio::post(callerExecutor, boost::asio::use_awaitable);
      if (error)
      {
        std::rethrow_exception(error);
      }
      co_return std::move(*result);
    }
  }
}

#endif
