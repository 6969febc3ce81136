#ifndef TASKMAN_ASYNC_AMBIENTEXECUTOR_HPP
#define TASKMAN_ASYNC_AMBIENTEXECUTOR_HPP
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

#include <Taskman/Async/AmbientState.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/query.hpp>
#include <boost/asio/require.hpp>
#include <type_traits>
#include <utility>

namespace Taskman::Async
{
  /// @brief Executor adapter that carries an AmbientState with the work it schedules.
  ///
  /// Every function submitted through this executor runs inside an AmbientScope for the carried
  /// state. A coroutine spawned on an AmbientExecutor is resumed through that executor after each
  /// suspension, so the state follows the logical task rather than the physical thread. Child tasks
  /// that are spawned from `co_await boost::asio::this_coro::executor` inherit the state.
  ///
  /// All properties are forwarded to the wrapped executor; require/prefer keep the state attached.
  class AmbientExecutor
  {
    boost::asio::any_io_executor m_inner;
    AmbientState m_state;

  public:
    AmbientExecutor(boost::asio::any_io_executor inner, AmbientState state) noexcept
      : m_inner(std::move(inner))
      , m_state(std::move(state))
    {
    }

    [[nodiscard]] const boost::asio::any_io_executor& GetInnerExecutor() const noexcept
    {
      return m_inner;
    }

    [[nodiscard]] const AmbientState& GetState() const noexcept
    {
      return m_state;
    }

    template <typename Property>
    auto query(const Property& property) const
      noexcept(noexcept(boost::asio::query(std::declval<const boost::asio::any_io_executor&>(), property)))
        -> decltype(boost::asio::query(std::declval<const boost::asio::any_io_executor&>(), property))
    {
      return boost::asio::query(m_inner, property);
    }

    template <typename Property>
    auto require(const Property& property) const
      -> std::enable_if_t<std::is_convertible_v<decltype(boost::asio::require(std::declval<const boost::asio::any_io_executor&>(), property)),
                                                boost::asio::any_io_executor>,
                          AmbientExecutor>
    {
      return AmbientExecutor(boost::asio::require(m_inner, property), m_state);
    }

    template <typename Property>
    auto prefer(const Property& property) const
      -> std::enable_if_t<std::is_convertible_v<decltype(boost::asio::prefer(std::declval<const boost::asio::any_io_executor&>(), property)),
                                                boost::asio::any_io_executor>,
                          AmbientExecutor>
    {
      return AmbientExecutor(boost::asio::prefer(m_inner, property), m_state);
    }

    template <typename Function>
    void execute(Function&& function) const
    {
      boost::asio::execution::execute(m_inner,
                                      [state = m_state, function = std::decay_t<Function>(std::forward<Function>(function))]() mutable
                                      {
                                        AmbientScope scope(state);
                                        function();
                                      });
    }

    friend bool operator==(const AmbientExecutor& lhs, const AmbientExecutor& rhs) noexcept
    {
      return lhs.m_inner == rhs.m_inner && lhs.m_state == rhs.m_state;
    }

    friend bool operator!=(const AmbientExecutor& lhs, const AmbientExecutor& rhs) noexcept
    {
      return !(lhs == rhs);
    }
  };

  /// @brief Strips any AmbientExecutor layer so a new state can be attached without stacking adapters.
  [[nodiscard]] inline boost::asio::any_io_executor UnwrapAmbientExecutor(const boost::asio::any_io_executor& executor)
  {
    if (const auto* ambient = executor.target<AmbientExecutor>())
    {
      return ambient->GetInnerExecutor();
    }
    return executor;
  }

  /// @brief Wraps @p executor so that everything scheduled on it runs with @p state installed.
  [[nodiscard]] inline boost::asio::any_io_executor MakeAmbientExecutor(const boost::asio::any_io_executor& executor, AmbientState state)
  {
    return AmbientExecutor(UnwrapAmbientExecutor(executor), std::move(state));
  }
}

#endif
