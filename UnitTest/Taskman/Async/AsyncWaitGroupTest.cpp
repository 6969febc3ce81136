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

#include <Taskman/Async/AsyncWaitGroup.hpp>
#include <Taskman/Async/CompletionSignal.hpp>
#include <Taskman/AsyncTestHelper.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

namespace Taskman::Async
{
  // ============================================================================
  // CompletionSignal
  // ============================================================================

  TEST(CompletionSignalTest, Set_WakesEveryWaiter)
  {
    boost::asio::io_context io;
    CompletionSignal signal(io.get_executor());
    int woken = 0;

    for (int i = 0; i < 3; ++i)
    {
      boost::asio::co_spawn(
        io,
        [&signal, &woken]() -> boost::asio::awaitable<void>
        {
          co_await signal.WaitAsync();
          ++woken;
        },
        boost::asio::detached);
    }
    boost::asio::co_spawn(
      io,
      [&signal]() -> boost::asio::awaitable<void>
      {
        co_await TestUtil::DelayAsync(std::chrono::milliseconds(5));
        signal.Set();
      },
      boost::asio::detached);

    io.run();

    EXPECT_TRUE(signal.IsSet());
    EXPECT_EQ(woken, 3);
  }

  TEST(CompletionSignalTest, WaitAsync_AlreadySet_ReturnsImmediately)
  {
    boost::asio::io_context io;
    CompletionSignal signal(io.get_executor());
    signal.Set();
    signal.Set();

    TestUtil::RunToCompletion(io, [&signal]() -> boost::asio::awaitable<void> { co_await signal.WaitAsync(); }());

    EXPECT_TRUE(signal.IsSet());
  }

  // ============================================================================
  // AsyncWaitGroup
  // ============================================================================

  TEST(AsyncWaitGroupTest, WaitAsync_NothingAdded_ReturnsImmediately)
  {
    boost::asio::io_context io;
    AsyncWaitGroup group(io.get_executor());

    TestUtil::RunToCompletion(io, [&group]() -> boost::asio::awaitable<void> { co_await group.WaitAsync(); }());

    EXPECT_EQ(group.GetPendingCount(), 0u);
  }

  TEST(AsyncWaitGroupTest, WaitAsync_ResumesAfterLastChild)
  {
    boost::asio::io_context io;
    std::vector<int> finished;

    TestUtil::RunToCompletion(io,
                          [&finished]() -> boost::asio::awaitable<void>
                          {
                            auto executor = co_await boost::asio::this_coro::executor;
                            AsyncWaitGroup group(executor);
                            group.Add(3);
                            for (int i = 0; i < 3; ++i)
                            {
                              boost::asio::co_spawn(
                                executor,
                                [&group, &finished, i]() -> boost::asio::awaitable<void>
                                {
                                  co_await TestUtil::DelayAsync(std::chrono::milliseconds(3 * (3 - i)));
                                  finished.push_back(i);
                                  group.Done();
                                },
                                boost::asio::detached);
                            }
                            co_await group.WaitAsync();
                            EXPECT_EQ(finished.size(), 3u);
                            EXPECT_EQ(group.GetPendingCount(), 0u);
                          }());

    EXPECT_EQ(finished, (std::vector<int>{2, 1, 0}));
  }

  TEST(AsyncWaitGroupTest, Done_MoreThanAdded_Throws)
  {
    boost::asio::io_context io;
    AsyncWaitGroup group(io.get_executor());
    group.Add();
    group.Done();

    EXPECT_THROW(group.Done(), std::logic_error);
  }

  TEST(AsyncWaitGroupTest, Add_AfterRelease_Throws)
  {
    boost::asio::io_context io;
    AsyncWaitGroup group(io.get_executor());
    group.Add(2);
    group.Done();
    group.Done();

    EXPECT_THROW(group.Add(), std::logic_error);
  }
}
