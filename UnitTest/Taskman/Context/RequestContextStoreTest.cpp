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

#include <Taskman/AsyncTestHelper.hpp>
#include <Taskman/Context/RequestContextStore.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Taskman
{
  namespace
  {
    PartialRequestContext MakePartial(std::string requestId, std::optional<std::string> correlationId = std::nullopt)
    {
      PartialRequestContext partial;
      partial.RequestId = std::move(requestId);
      partial.CorrelationId = std::move(correlationId);
      return partial;
    }
  }

  // ============================================================================
  // Synchronous Run
  // ============================================================================

  TEST(RequestContextStoreTest, Accessors_NoContext_ReturnEmpty)
  {
    RequestContextStore store;

    EXPECT_FALSE(store.HasContext());
    EXPECT_EQ(store.GetContext(), nullptr);
    EXPECT_EQ(store.GetRequestId(), std::nullopt);
    EXPECT_EQ(store.GetCorrelationId(), std::nullopt);
    EXPECT_EQ(store.GetRequestDuration(), std::nullopt);
    EXPECT_FALSE(store.GetContextStats().has_value());
  }

  TEST(RequestContextStoreTest, Run_ReturnsValueAndExposesContext)
  {
    RequestContextStore store;

    const auto result = store.Run(MakePartial("req-1", "corr-1"),
                                  [&store]()
                                  {
                                    EXPECT_TRUE(store.HasContext());
                                    EXPECT_EQ(store.GetCorrelationId(), std::optional<std::string>("corr-1"));
                                    return store.GetRequestId().value_or("");
                                  });

    EXPECT_EQ(result, "req-1");
    EXPECT_FALSE(store.HasContext());
  }

  TEST(RequestContextStoreTest, Run_MissingRequestId_GeneratesPrefixedId)
  {
    RequestContextStore store;

    const auto first = store.Run(PartialRequestContext{}, [&store]() { return store.GetRequestId().value_or(""); });
    const auto second = store.Run(MakePartial(""), [&store]() { return store.GetRequestId().value_or(""); });

    EXPECT_EQ(first.rfind("req-", 0), 0u);
    EXPECT_GT(first.size(), 4u);
    EXPECT_EQ(second.rfind("req-", 0), 0u);
    EXPECT_NE(first, second);
  }

  TEST(RequestContextStoreTest, Run_Throws_ExceptionPassesThroughAndContextIsLeft)
  {
    RequestContextStore store;

    EXPECT_THROW(store.Run(MakePartial("req-err"), []() -> int { throw std::runtime_error("handler failed"); }), std::runtime_error);
    EXPECT_FALSE(store.HasContext());
  }

  TEST(RequestContextStoreTest, Run_Nested_RestoresOuterContextObject)
  {
    RequestContextStore store;

    store.Run(MakePartial("outer"),
              [&store]()
              {
                const auto outerContext = store.GetContext();
                store.Run(MakePartial("inner"), [&store]() { EXPECT_EQ(store.GetRequestId(), std::optional<std::string>("inner")); });
                EXPECT_EQ(store.GetContext(), outerContext);
                EXPECT_EQ(store.GetRequestId(), std::optional<std::string>("outer"));
              });
  }

  TEST(RequestContextStoreTest, TwoStores_AreIndependent)
  {
    RequestContextStore first;
    RequestContextStore second;

    first.Run(MakePartial("req-a"), [&]() { EXPECT_FALSE(second.HasContext()); });
  }

  TEST(RequestContextStoreTest, CreateContext_KeepsSuppliedStartTime)
  {
    PartialRequestContext partial;
    partial.StartTime = RequestClock::now() - std::chrono::seconds(2);
    const auto context = RequestContextStore::CreateContext(partial);

    EXPECT_EQ(context->StartTime, *partial.StartTime);
    EXPECT_EQ(context->RequestId.rfind("req-", 0), 0u);
  }

  TEST(RequestContextStoreTest, GetRequestDuration_MeasuresFromStartTime)
  {
    RequestContextStore store;
    PartialRequestContext partial;
    partial.StartTime = RequestClock::now() - std::chrono::milliseconds(250);

    const auto duration = store.Run(std::move(partial), [&store]() { return store.GetRequestDuration(); });

    ASSERT_TRUE(duration.has_value());
    EXPECT_GE(duration->count(), 250);
  }

  // ============================================================================
  // Metadata
  // ============================================================================

  TEST(RequestContextStoreTest, UpdateMetadata_MergesIntoActiveContext)
  {
    RequestContextStore store;
    PartialRequestContext partial = MakePartial("req-meta");
    partial.Metadata.Set("tool", "list_tasks");

    const auto stats = store.Run(std::move(partial),
                                 [&store]()
                                 {
                                   store.UpdateMetadata(RequestMetadata{{"attempt", std::int64_t{2}}});
                                   store.UpdateMetadata(RequestMetadata{{"tool", std::string("get_task")}});
                                   return store.GetContextStats();
                                 });

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->RequestId, "req-meta");
    EXPECT_TRUE(stats->HasMetadata);
    EXPECT_EQ(stats->MetadataKeys, (std::vector<std::string>{"tool", "attempt"}));
  }

  TEST(RequestContextStoreTest, UpdateMetadata_NoContext_DoesNothing)
  {
    RequestContextStore store;

    EXPECT_NO_THROW(store.UpdateMetadata(RequestMetadata{{"ignored", true}}));
    EXPECT_FALSE(store.HasContext());
  }

  TEST(RequestContextStoreTest, GetContextStats_NoMetadata_ReportsNone)
  {
    RequestContextStore store;

    const auto stats = store.Run(MakePartial("req-plain", "corr-plain"), [&store]() { return store.GetContextStats(); });

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->CorrelationId, std::optional<std::string>("corr-plain"));
    EXPECT_FALSE(stats->HasMetadata);
    EXPECT_TRUE(stats->MetadataKeys.empty());
  }

  // ============================================================================
  // Coroutines
  // ============================================================================

  TEST(RequestContextStoreTest, RunAsync_ConcurrentRequests_NeverSeeEachOther)
  {
    boost::asio::io_context io;
    RequestContextStore store;

    // Request A sleeps longer than B, so B starts and finishes while A is suspended
    auto makeRequest = [&store](std::string id, std::chrono::milliseconds delay) -> boost::asio::awaitable<std::vector<std::string>>
    {
      co_return co_await store.RunAsync(MakePartial(id),
                                        [&store, delay]() -> boost::asio::awaitable<std::vector<std::string>>
                                        {
                                          std::vector<std::string> seen;
                                          seen.push_back(store.GetRequestId().value_or("<none>"));
                                          co_await TestUtil::DelayAsync(delay);
                                          seen.push_back(store.GetRequestId().value_or("<none>"));
                                          co_await TestUtil::DelayAsync(delay);
                                          seen.push_back(store.GetRequestId().value_or("<none>"));
                                          co_return seen;
                                        });
    };

    auto futureA = boost::asio::co_spawn(io, makeRequest("A", std::chrono::milliseconds(20)), boost::asio::use_future);
    auto futureB = boost::asio::co_spawn(io, makeRequest("B", std::chrono::milliseconds(5)), boost::asio::use_future);
    io.run();

    EXPECT_EQ(futureA.get(), (std::vector<std::string>{"A", "A", "A"}));
    EXPECT_EQ(futureB.get(), (std::vector<std::string>{"B", "B", "B"}));
  }

  TEST(RequestContextStoreTest, RunAsync_Nested_RestoresOuterAfterInnerReturns)
  {
    boost::asio::io_context io;
    RequestContextStore store;

    const auto result = TestUtil::RunToCompletion(
      io, store.RunAsync(MakePartial("outer"),
                         [&store]() -> boost::asio::awaitable<std::string>
                         {
                           const auto outerContext = store.GetContext();
                           const auto inner = co_await store.RunAsync(MakePartial("inner"),
                                                                      [&store]() -> boost::asio::awaitable<std::string>
                                                                      {
                                                                        co_await TestUtil::DelayAsync(std::chrono::milliseconds(2));
                                                                        co_return store.GetRequestId().value_or("<none>");
                                                                      });
                           EXPECT_EQ(store.GetContext(), outerContext);
                           co_return inner + "/" + store.GetRequestId().value_or("<none>");
                         }));

    EXPECT_EQ(result, "inner/outer");
    EXPECT_FALSE(store.HasContext());
  }

  TEST(RequestContextStoreTest, RunAsync_ChildTask_InheritsContext)
  {
    boost::asio::io_context io;
    RequestContextStore store;

    const auto result = TestUtil::RunToCompletion(
      io, store.RunAsync(MakePartial("parent"),
                         [&store]() -> boost::asio::awaitable<std::string>
                         {
                           auto executor = co_await boost::asio::this_coro::executor;
                           co_return co_await boost::asio::co_spawn(
                             executor,
                             [&store]() -> boost::asio::awaitable<std::string>
                             {
                               co_await TestUtil::DelayAsync(std::chrono::milliseconds(1));
                               co_return store.GetRequestId().value_or("<none>");
                             },
                             boost::asio::use_awaitable);
                         }));

    EXPECT_EQ(result, "parent");
  }

  TEST(RequestContextStoreTest, RunAsync_Throws_ExceptionPassesThrough)
  {
    boost::asio::io_context io;
    RequestContextStore store;

    EXPECT_THROW(TestUtil::RunToCompletion(io, store.RunAsync(MakePartial("req-throw"),
                                                          []() -> boost::asio::awaitable<void>
                                                          {
                                                            co_await TestUtil::DelayAsync(std::chrono::milliseconds(1));
                                                            throw std::runtime_error("boom");
                                                          })),
                 std::runtime_error);
  }

  // ============================================================================
  // Logger binding
  // ============================================================================

  TEST(RequestContextStoreTest, WithRequestLogger_BindsIdentifiers)
  {
    RequestContextStore store;

    const auto logger = store.Run(MakePartial("req-log", "corr-log"), [&store]() { return store.WithRequestLogger(); });

    EXPECT_EQ(logger.FindField("requestId"), std::optional<std::string>("req-log"));
    EXPECT_EQ(logger.FindField("correlationId"), std::optional<std::string>("corr-log"));
  }

  TEST(RequestContextStoreTest, WithRequestLogger_NoCorrelationId_BindsRequestIdOnly)
  {
    RequestContextStore store;

    const auto logger = store.Run(MakePartial("req-only"), [&store]() { return store.WithRequestLogger(); });

    EXPECT_EQ(logger.GetFields().size(), 1u);
    EXPECT_EQ(logger.FindField("correlationId"), std::nullopt);
  }

  TEST(RequestContextStoreTest, WithRequestLogger_NoContext_ReturnsBaseLogger)
  {
    RequestContextStore store;
    const auto base = ContextLogger().With("component", "test");

    const auto logger = store.WithRequestLogger(base);

    EXPECT_EQ(logger.GetFields(), base.GetFields());
  }
}
