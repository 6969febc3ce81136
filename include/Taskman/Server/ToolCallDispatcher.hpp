#ifndef TASKMAN_SERVER_TOOLCALLDISPATCHER_HPP
#define TASKMAN_SERVER_TOOLCALLDISPATCHER_HPP
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

#include <Taskman/Context/RequestContextStore.hpp>
#include <Taskman/Server/ToolCall.hpp>
#include <Taskman/Tracing/TracingSpanManager.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <spdlog/logger.h>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Taskman
{
  /// @brief Runs tool invocations through the request lifecycle.
  ///
  /// For every call the dispatcher opens a request context (keeping the caller's request and correlation
  /// ids, metadata "tool"), runs the handler inside a "tool.<name>" span and bounds it with the tool
  /// timeout. Every failure, including an unknown tool or a timeout, becomes an error result; DispatchAsync
  /// itself does not throw because of the handler.
  class ToolCallDispatcher
  {
    RequestContextStore& m_contexts;
    TracingSpanManager& m_spans;
    std::chrono::milliseconds m_toolTimeout;
    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<IToolHandler>> m_tools;

  public:
    ToolCallDispatcher(RequestContextStore& contexts, TracingSpanManager& spans, std::chrono::milliseconds toolTimeout);

    ToolCallDispatcher(const ToolCallDispatcher&) = delete;
    ToolCallDispatcher& operator=(const ToolCallDispatcher&) = delete;

    std::chrono::milliseconds GetToolTimeout() const noexcept
    {
      return m_toolTimeout;
    }

    /// @return false if @p handler is null or a tool called @p name exists.
    bool RegisterTool(std::string name, std::shared_ptr<IToolHandler> handler);

    bool UnregisterTool(const std::string& name);

    /// @brief Removes every tool.
    /// @return The number of tools removed.
    std::size_t UnregisterAllTools();

    bool HasTool(const std::string& name) const;

    /// @brief Tool names in alphabetical order.
    std::vector<std::string> GetToolNames() const;

    boost::asio::awaitable<ToolCallResult> DispatchAsync(ToolCallRequest request);

  private:
    std::shared_ptr<IToolHandler> TryGetTool(const std::string& name) const;
    boost::asio::awaitable<ToolCallResult> InvokeInContextAsync(std::shared_ptr<IToolHandler> handler, ToolCallRequest request);
  };
}

#endif
