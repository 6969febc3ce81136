#ifndef TASKMAN_BACKEND_GUARDEDBACKENDCLIENT_HPP
#define TASKMAN_BACKEND_GUARDEDBACKENDCLIENT_HPP
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

#include <Taskman/Backend/IBackendClient.hpp>
#include <Taskman/Tracing/TracingSpanManager.hpp>
#include <chrono>
#include <memory>

namespace Taskman
{
  /// @brief Decorator that bounds and traces every backend call.
  ///
  /// Each call runs inside a "backend.request" span carrying http.method, http.url and http.status_code,
  /// and is awaited for at most the configured timeout (TimeoutException otherwise). The inner call is not
  /// cancelled on timeout.
  class GuardedBackendClient final : public IBackendClient
  {
    std::shared_ptr<IBackendClient> m_inner;
    TracingSpanManager& m_spans;
    std::chrono::milliseconds m_timeout;

  public:
    static constexpr const char* SpanName = "backend.request";

    GuardedBackendClient(std::shared_ptr<IBackendClient> inner, TracingSpanManager& spans, std::chrono::milliseconds timeout);

    std::chrono::milliseconds GetTimeout() const noexcept
    {
      return m_timeout;
    }

    boost::asio::awaitable<BackendResponse> SendAsync(BackendRequest request) override;
  };
}

#endif
