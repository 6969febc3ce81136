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

#include <Taskman/Backend/GuardedBackendClient.hpp>
#include <Taskman/Tracing/SemanticAttributes.hpp>
#include <Taskman/Timeout/TimeoutGuard.hpp>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace Taskman
{
  GuardedBackendClient::GuardedBackendClient(std::shared_ptr<IBackendClient> inner, TracingSpanManager& spans, const std::chrono::milliseconds timeout)
    : m_inner(std::move(inner))
    , m_spans(spans)
    , m_timeout(timeout)
  {
    if (!m_inner)
    {
      throw std::invalid_argument("GuardedBackendClient: inner client can not be null");
    }
  }

  boost::asio::awaitable<BackendResponse> GuardedBackendClient::SendAsync(BackendRequest request)
  {
    SpanAttributes attributes;
    attributes.emplace(SemanticAttributes::HttpMethod, request.Method);
    attributes.emplace(SemanticAttributes::HttpUrl, request.Path);

    auto operationName = fmt::format("{} {}", request.Method, request.Path);
    auto send = [inner = m_inner, timeout = m_timeout, operationName = std::move(operationName),
                 request = std::move(request)](Span& span) mutable -> boost::asio::awaitable<BackendResponse>
    {
      auto call = [inner, request = std::move(request)]() mutable { return inner->SendAsync(std::move(request)); };
      auto response = co_await WithTimeout(std::move(call), timeout, operationName);
      span.SetAttribute(SemanticAttributes::HttpStatusCode, static_cast<std::int64_t>(response.StatusCode));
      if (response.StatusCode >= 500)
      {
        span.SetStatus(SpanStatus{SpanStatusCode::Error, fmt::format("HTTP {}", response.StatusCode)});
      }
      co_return response;
    };
    std::string spanName(SpanName);
    co_return co_await m_spans.WithSpanAsync(std::move(spanName), std::move(attributes), std::move(send));
  }
}
