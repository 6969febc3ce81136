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
#include <Taskman/Backend/GuardedBackendClient.hpp>
#include <Taskman/Exception/TimeoutException.hpp>
#include <Taskman/Tracing/InMemoryTracer.hpp>
#include <Taskman/Tracing/SemanticAttributes.hpp>
#include <Taskman/Tracing/TracingSpanManager.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Taskman
{
  using namespace std::chrono_literals;

  namespace
  {
    class FakeBackendClient final : public IBackendClient
    {
    public:
      BackendResponse Response{200, "{}"};
      std::chrono::milliseconds Delay{0};
      bool Throws{false};
      std::vector<std::string> Calls;

      boost::asio::awaitable<BackendResponse> SendAsync(BackendRequest request) override
      {
        Calls.push_back(request.Method + " " + request.Path);
        if (Delay.count() > 0)
        {
          co_await TestUtil::DelayAsync(Delay);
        }
        if (Throws)
        {
          throw std::runtime_error("connection refused");
        }
        co_return Response;
      }
    };
  }

  class GuardedBackendClientTest : public ::testing::Test
  {
  protected:
    boost::asio::io_context m_ioContext;
    std::shared_ptr<InMemoryTracer> m_tracer{std::make_shared<InMemoryTracer>()};
    TracingSpanManager m_spans{m_tracer};
    std::shared_ptr<FakeBackendClient> m_backend{std::make_shared<FakeBackendClient>()};
    GuardedBackendClient m_client{m_backend, m_spans, 100ms};

    BackendResponse Send(std::string method, std::string path)
    {
      return TestUtil::RunToCompletion(m_ioContext, m_client.SendAsync(BackendRequest{std::move(method), std::move(path), ""}));
    }

    std::shared_ptr<const Span> LastSpan() const
    {
      return m_tracer->FindFinishedSpan(GuardedBackendClient::SpanName);
    }
  };

  TEST_F(GuardedBackendClientTest, Construct_NullInner_Throws)
  {
    EXPECT_THROW(GuardedBackendClient(nullptr, m_spans, 1s), std::invalid_argument);
  }

  TEST_F(GuardedBackendClientTest, SendAsync_Success_RecordsHttpAttributes)
  {
    const auto response = Send("GET", "/api/v1/tasks/T-1");

    EXPECT_EQ(response.StatusCode, 200);
    EXPECT_EQ(m_backend->Calls, (std::vector<std::string>{"GET /api/v1/tasks/T-1"}));
    auto span = LastSpan();
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(ToString(*span->GetAttribute(SemanticAttributes::HttpMethod)), "GET");
    EXPECT_EQ(ToString(*span->GetAttribute(SemanticAttributes::HttpUrl)), "/api/v1/tasks/T-1");
    EXPECT_EQ(std::get<std::int64_t>(*span->GetAttribute(SemanticAttributes::HttpStatusCode)), 200);
    EXPECT_EQ(span->GetStatus().Code, SpanStatusCode::Unset);
  }

  TEST_F(GuardedBackendClientTest, SendAsync_ServerError_MarksSpanAsError)
  {
    m_backend->Response = BackendResponse{503, "unavailable"};

    const auto response = Send("POST", "/api/v1/tasks");

    EXPECT_EQ(response.StatusCode, 503);
    auto span = LastSpan();
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(span->GetStatus(), (SpanStatus{SpanStatusCode::Error, std::string("HTTP 503")}));
  }

  TEST_F(GuardedBackendClientTest, SendAsync_ClientError_IsReturnedNotThrown)
  {
    m_backend->Response = BackendResponse{404, "not found"};

    const auto response = Send("GET", "/api/v1/tasks/nope");

    EXPECT_EQ(response.StatusCode, 404);
    EXPECT_EQ(LastSpan()->GetStatus().Code, SpanStatusCode::Unset);
  }

  TEST_F(GuardedBackendClientTest, SendAsync_SlowBackend_ThrowsTimeoutNamingRequest)
  {
    m_backend->Delay = 300ms;

    try
    {
      Send("DELETE", "/api/v1/tasks/T-2");
      FAIL() << "Expected TimeoutException";
    }
    catch (const TimeoutException& ex)
    {
      EXPECT_EQ(ex.GetOperationName(), "DELETE /api/v1/tasks/T-2");
      EXPECT_EQ(ex.GetTimeout(), 100ms);
    }
    auto span = LastSpan();
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(span->GetStatus().Code, SpanStatusCode::Error);
  }

  TEST_F(GuardedBackendClientTest, SendAsync_TransportFailure_PassesThrough)
  {
    m_backend->Throws = true;

    EXPECT_THROW(Send("GET", "/api/v1/projects"), std::runtime_error);
    ASSERT_NE(LastSpan(), nullptr);
    EXPECT_EQ(LastSpan()->GetExceptions().size(), 1u);
  }
}
