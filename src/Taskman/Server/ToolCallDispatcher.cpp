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

#include <Taskman/Common/SpdLogHelper.hpp>
#include <Taskman/Exception/TimeoutException.hpp>
#include <Taskman/Server/ToolCallDispatcher.hpp>
#include <Taskman/Timeout/TimeoutGuard.hpp>
#include <Taskman/Tracing/SemanticAttributes.hpp>
#include <fmt/format.h>
#include <exception>
#include <optional>
#include <utility>

namespace Taskman
{
  ToolCallDispatcher::ToolCallDispatcher(RequestContextStore& contexts, TracingSpanManager& spans, const std::chrono::milliseconds toolTimeout)
    : m_contexts(contexts)
    , m_spans(spans)
    , m_toolTimeout(toolTimeout)
    , m_logger(SpdLogHelper::GetLogger("Tools"))
  {
  }

  bool ToolCallDispatcher::RegisterTool(std::string name, std::shared_ptr<IToolHandler> handler)
  {
    if (!handler)
    {
      m_logger->error("RegisterTool: handler for '{}' is null", name);
      return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_tools.find(name) != m_tools.end())
    {
      m_logger->error("RegisterTool: tool '{}' is already registered", name);
      return false;
    }
    m_logger->debug("RegisterTool: registering tool '{}'", name);
    m_tools.emplace(std::move(name), std::move(handler));
    return true;
  }

  bool ToolCallDispatcher::UnregisterTool(const std::string& name)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tools.erase(name) > 0;
  }

  std::size_t ToolCallDispatcher::UnregisterAllTools()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto count = m_tools.size();
    m_tools.clear();
    return count;
  }

  bool ToolCallDispatcher::HasTool(const std::string& name) const
  {
    return TryGetTool(name) != nullptr;
  }

  std::vector<std::string> ToolCallDispatcher::GetToolNames() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_tools.size());
    for (const auto& entry : m_tools)
    {
      names.push_back(entry.first);
    }
    return names;
  }

  boost::asio::awaitable<ToolCallResult> ToolCallDispatcher::DispatchAsync(ToolCallRequest request)
  {
    auto handler = TryGetTool(request.ToolName);

    PartialRequestContext partial;
    partial.RequestId = request.RequestId;
    partial.CorrelationId = request.CorrelationId;
    partial.Metadata.Set("tool", request.ToolName);

    auto invoke = [this, handler = std::move(handler), request = std::move(request)]() mutable
    { return InvokeInContextAsync(std::move(handler), std::move(request)); };
    co_return co_await m_contexts.RunAsync(std::move(partial), std::move(invoke));
  }

  std::shared_ptr<IToolHandler> ToolCallDispatcher::TryGetTool(const std::string& name) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto itrFind = m_tools.find(name);
    return itrFind != m_tools.end() ? itrFind->second : nullptr;
  }

  boost::asio::awaitable<ToolCallResult> ToolCallDispatcher::InvokeInContextAsync(std::shared_ptr<IToolHandler> handler, ToolCallRequest request)
  {
    const auto log = m_contexts.WithRequestLogger(ContextLogger(m_logger));
    const std::string toolName = request.ToolName;

    if (!handler)
    {
      log.Warn("Unknown tool: {}", toolName);
      co_return ToolCallResult::Failure(fmt::format("Unknown tool: {}", toolName));
    }

    log.Info("Tool call started: {}", toolName);

    SpanAttributes attributes;
    attributes.emplace(SemanticAttributes::ToolName, toolName);
    attributes.emplace(SemanticAttributes::RequestId, m_contexts.GetRequestId().value_or(""));

    auto spanName = fmt::format("tool.{}", toolName);
    auto guarded = [handler, timeout = m_toolTimeout, operationName = spanName, request = std::move(request)]() mutable
    {
      auto call = [handler, request = std::move(request)]() { return handler->HandleAsync(request); };
      return WithTimeout(std::move(call), timeout, std::move(operationName));
    };

    std::optional<std::string> failure;
    try
    {
      auto result = co_await m_spans.WithSpanAsync(std::move(spanName), std::move(attributes), std::move(guarded));
      log.Info("Tool call finished: {} isError={} durationMs={}", toolName, result.IsError, m_contexts.GetRequestDuration().value_or(std::chrono::milliseconds(0)).count());
      co_return result;
    }
    catch (const TimeoutException& ex)
    {
      failure = ex.what();
    }
    catch (const std::exception& ex)
    {
      failure = fmt::format("Tool '{}' failed: {}", toolName, ex.what());
    }
    catch (...)
    {
      failure = fmt::format("Tool '{}' failed: unknown error", toolName);
    }

    log.Error("Tool call failed: {}", *failure);
    co_return ToolCallResult::Failure(std::move(*failure));
  }
}
