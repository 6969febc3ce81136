#ifndef TASKMAN_ASYNC_ASYNCWAITGROUP_HPP
#define TASKMAN_ASYNC_ASYNCWAITGROUP_HPP
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

#include <Taskman/Async/CompletionSignal.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <stdexcept>

namespace Taskman::Async
{
  /// @brief Counts outstanding child tasks so a parent can join all of them.
  ///
  /// Add() before spawning, Done() when a child finishes (on every path), WaitAsync() to join.
  /// A group is single use: once the count has dropped to zero the group stays released.
  class AsyncWaitGroup
  {
    std::size_t m_pending{0};
    CompletionSignal m_allDone;

  public:
    explicit AsyncWaitGroup(const boost::asio::any_io_executor& executor)
      : m_allDone(executor)
    {
    }

    std::size_t GetPendingCount() const noexcept
    {
      return m_pending;
    }

    void Add(const std::size_t count = 1)
    {
      if (m_allDone.IsSet())
      {
        throw std::logic_error("AsyncWaitGroup::Add called after the group was released");
      }
      m_pending += count;
    }

    void Done()
    {
      if (m_pending == 0)
      {
        throw std::logic_error("AsyncWaitGroup::Done called more times than Add");
      }
      --m_pending;
      if (m_pending == 0)
      {
        m_allDone.Set();
      }
    }

    boost::asio::awaitable<void> WaitAsync()
    {
      if (m_pending == 0)
      {
        co_return;
      }
      co_await m_allDone.WaitAsync();
    }
  };
}

#endif
