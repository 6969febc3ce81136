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
#include <Taskman/Server/ToolCallDispatcher.hpp>
#include <Taskman/Tracing/InMemoryTracer.hpp>
#include <Taskman/Tracing/SemanticAttributes.hpp>
#include <Taskman/Tracing/TracingSpanManager.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Taskman
{
  using namespace std::chrono_literals;

  class ToolCallDispatcherTest : public ::testing::Test
  {
  protected:
    boost::asio::io_context m_ioContext;
    std::shared_ptr<InMemoryTracer> m_tracer{std::make_shared<InMemoryTracer>()};
    RequestContextStore m_contexts;
    TracingSpanManager m_spans{m_tracer};
    ToolCallDispatcher m_dispatcher{m_contexts, m_spans, 100ms};

    ToolCallResult Dispatch(ToolCallRequest request)
    {
      return TestUtil::RunToCompletion(m_ioContext, m_dispatcher.DispatchAsync(std::move(request)));
    }

    static ToolCallRequest MakeRequest(std::string toolName)
    {
      ToolCallRequest request;
      request.ToolName = std::move(toolName);
      return request;
    }
  };

  // ============================================================================
  // Registry
  // ============================================================================

  TEST_F(ToolCallDispatcherTest, RegisterTool_DuplicateOrNull_IsRejected)
  {
    auto handler = MakeToolHandler([](const ToolCallRequest&) { return ToolCallResult::Success("ok"); });

    EXPECT_TRUE(m_dispatcher.RegisterTool("list_tasks", handler));
    EXPECT_FALSE(m_dispatcher.RegisterTool("list_tasks", handler));
    EXPECT_FALSE(m_dispatcher.RegisterTool("get_task", nullptr));
    EXPECT_TRUE(m_dispatcher.HasTool("list_tasks"));
    EXPECT_FALSE(m_dispatcher.HasTool("get_task"));
  }

  TEST_F(ToolCallDispatcherTest, GetToolNames_IsSorted)
  {
    auto handler = MakeToolHandler([](const ToolCallRequest&) { return ToolCallResult::Success("ok"); });
    m_dispatcher.RegisterTool("update_task", handler);
    m_dispatcher.RegisterTool("create_task", handler);

    EXPECT_EQ(m_dispatcher.GetToolNames(), (std::vector<std::string>{"create_task", "update_task"}));
    EXPECT_TRUE(m_dispatcher.UnregisterTool("create_task"));
    EXPECT_FALSE(m_dispatcher.UnregisterTool("create_task"));
    EXPECT_EQ(m_dispatcher.UnregisterAllTools(), 1u);
    EXPECT_TRUE(m_dispatcher.GetToolNames().empty());
  }

  // ============================================================================
  // Dispatch
  // ============================================================================

  TEST_F(ToolCallDispatcherTest, DispatchAsync_UnknownTool_ReturnsErrorResult)
  {
    const auto result = Dispatch(MakeRequest("missing"));

    EXPECT_EQ(result, ToolCallResult::Failure("Unknown tool: missing"));
  }

  TEST_F(ToolCallDispatcherTest, DispatchAsync_RunsHandlerInsideRequestContextAndSpan)
  {
    std::string seenRequestId;
    std::string seenCorrelationId;
    bool toolMetadataSet = false;
    bool spanActive = false;
    m_dispatcher.RegisterTool("get_task",
                              MakeToolHandler(
                                [&](const ToolCallRequest& request) -> boost::asio::awaitable<ToolCallResult>
                                {
                                  co_await TestUtil::DelayAsync(1ms);
                                  seenRequestId = m_contexts.GetRequestId().value_or("<none>");
                                  seenCorrelationId = m_contexts.GetCorrelationId().value_or("<none>");
                                  const auto context = m_contexts.GetContext();
                                  toolMetadataSet = context && context->Metadata.Contains("tool");
                                  spanActive = m_spans.GetActiveSpan() != nullptr;
                                  co_return ToolCallResult::Success("task " + request.Arguments);
                                }));

    auto request = MakeRequest("get_task");
    request.Arguments = R"({"id":"T-1"})";
    request.RequestId = "req-42";
    request.CorrelationId = "corr-42";
    const auto result = Dispatch(std::move(request));

    EXPECT_EQ(result, ToolCallResult::Success(R"(task {"id":"T-1"})"));
    EXPECT_EQ(seenRequestId, "req-42");
    EXPECT_EQ(seenCorrelationId, "corr-42");
    EXPECT_TRUE(toolMetadataSet);
    EXPECT_TRUE(spanActive);
    EXPECT_FALSE(m_contexts.HasContext());

    auto span = m_tracer->FindFinishedSpan("tool.get_task");
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(ToString(*span->GetAttribute(SemanticAttributes::ToolName)), "get_task");
    EXPECT_EQ(ToString(*span->GetAttribute(SemanticAttributes::RequestId)), "req-42");
  }

  TEST_F(ToolCallDispatcherTest, DispatchAsync_NoRequestId_GeneratesOne)
  {
    std::string seenRequestId;
    m_dispatcher.RegisterTool("whoami", MakeToolHandler(
                                          [this, &seenRequestId](const ToolCallRequest&)
                                          {
                                            seenRequestId = m_contexts.GetRequestId().value_or("");
                                            return ToolCallResult::Success(seenRequestId);
                                          }));

    const auto result = Dispatch(MakeRequest("whoami"));

    EXPECT_FALSE(result.IsError);
    EXPECT_EQ(seenRequestId.rfind("req-", 0), 0u);
  }

  TEST_F(ToolCallDispatcherTest, DispatchAsync_SlowTool_ReturnsTimeoutMessage)
  {
    m_dispatcher.RegisterTool("slow", MakeToolHandler(
                                        [](const ToolCallRequest&) -> boost::asio::awaitable<ToolCallResult>
                                        {
                                          co_await TestUtil::DelayAsync(300ms);
                                          co_return ToolCallResult::Success("late");
                                        }));

    const auto result = Dispatch(MakeRequest("slow"));

    EXPECT_EQ(result, ToolCallResult::Failure("Operation 'tool.slow' timed out after 100ms"));
    auto span = m_tracer->FindFinishedSpan("tool.slow");
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(span->GetStatus().Code, SpanStatusCode::Error);
  }

  TEST_F(ToolCallDispatcherTest, DispatchAsync_ThrowingTool_ReturnsErrorResult)
  {
    m_dispatcher.RegisterTool("broken", MakeToolHandler([](const ToolCallRequest&) -> ToolCallResult { throw std::runtime_error("backend down"); }));

    const auto result = Dispatch(MakeRequest("broken"));

    EXPECT_EQ(result, ToolCallResult::Failure("Tool 'broken' failed: backend down"));
    auto span = m_tracer->FindFinishedSpan("tool.broken");
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(span->GetExceptions().size(), 1u);
  }
}
