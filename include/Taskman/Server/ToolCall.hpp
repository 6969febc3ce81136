#ifndef TASKMAN_SERVER_TOOLCALL_HPP
#define TASKMAN_SERVER_TOOLCALL_HPP
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

#include <Taskman/Async/AmbientSpawn.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace Taskman
{
  /// @brief One parsed tool invocation as delivered by the transport.
  struct ToolCallRequest
  {
    std::string ToolName;
    /// Tool arguments as JSON text; only the tool handler interprets them.
    std::string Arguments{"{}"};
    std::optional<std::string> RequestId;
    std::optional<std::string> CorrelationId;
  };

  struct ToolCallResult
  {
    bool IsError{false};
    std::string Content;

    static ToolCallResult Success(std::string content)
    {
      return ToolCallResult{false, std::move(content)};
    }

    static ToolCallResult Failure(std::string message)
    {
      return ToolCallResult{true, std::move(message)};
    }

    bool operator==(const ToolCallResult& rhs) const = default;
  };

  class IToolHandler
  {
  public:
    virtual ~IToolHandler() = default;

    /// @brief Executes the tool. Runs inside the request context and the tool span opened by the dispatcher.
    virtual boost::asio::awaitable<ToolCallResult> HandleAsync(const ToolCallRequest& request) = 0;
  };

  namespace Internal
  {
    template <typename Func>
    class CallbackToolHandler final : public IToolHandler
    {
      Func m_func;

    public:
      explicit CallbackToolHandler(Func func)
        : m_func(std::move(func))
      {
      }

      boost::asio::awaitable<ToolCallResult> HandleAsync(const ToolCallRequest& request) override
      {
        if constexpr (Async::IsAwaitableV<std::invoke_result_t<Func&, const ToolCallRequest&>>)
        {
          co_return co_await m_func(request);
        }
        else
        {
          co_return m_func(request);
        }
      }
    };
  }

  /// @brief Adapts a callable taking `const ToolCallRequest&` and returning ToolCallResult (or an awaitable of it).
  template <typename Func>
  std::shared_ptr<IToolHandler> MakeToolHandler(Func func)
  {
    return std::make_shared<Internal::CallbackToolHandler<Func>>(std::move(func));
  }
}

#endif
