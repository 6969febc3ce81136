#ifndef TASKMAN_ASYNC_COMPLETIONSIGNAL_HPP
#define TASKMAN_ASYNC_COMPLETIONSIGNAL_HPP
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
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace Taskman::Async
{
  /// @brief One-shot event that any number of coroutines can wait for.
  ///
  /// Implemented with a steady_timer that never expires; Set() cancels it which wakes every waiter.
  /// Waiters resume through their own executor so their ambient state is unaffected by who called Set().
  ///
  /// Not thread safe. Set() and WaitAsync() must be called from the thread that runs the executor.
  class CompletionSignal
  {
    boost::asio::steady_timer m_timer;
    bool m_isSet{false};

  public:
    explicit CompletionSignal(const boost::asio::any_io_executor& executor)
      : m_timer(UnwrapAmbientExecutor(executor), boost::asio::steady_timer::time_point::max())
    {
    }

    CompletionSignal(const CompletionSignal&) = delete;
    CompletionSignal& operator=(const CompletionSignal&) = delete;
    CompletionSignal(CompletionSignal&&) = delete;
    CompletionSignal& operator=(CompletionSignal&&) = delete;

    bool IsSet() const noexcept
    {
      return m_isSet;
    }

    /// @brief Releases all current and future waiters. Calling it again has no effect.
    void Set()
    {
      if (!m_isSet)
      {
        m_isSet = true;
        m_timer.cancel();
      }
    }

    boost::asio::awaitable<void> WaitAsync()
    {
      while (!m_isSet)
      {
        // The wait only ever ends with operation_aborted, which is the wake up
        boost::system::error_code ec;
        co_await m_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      }
    }
  };
}

#endif
