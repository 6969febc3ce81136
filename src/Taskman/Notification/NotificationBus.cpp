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
#include <Taskman/Common/SpdLogHelper.hpp>
#include <Taskman/Notification/NotificationBus.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>
#include <algorithm>
#include <exception>
#include <utility>

namespace Taskman
{
  namespace
  {
    struct EmitState
    {
      NotificationEvent Event;
      NotificationKind Kind;
      Async::AsyncWaitGroup Pending;
      std::size_t FailureCount{0};

      EmitState(NotificationEvent event, const boost::asio::any_io_executor& executor)
        : Event(std::move(event))
        , Kind(GetKind(Event))
        , Pending(executor)
      {
      }
    };

    boost::asio::awaitable<void> RunHandlerAsync(std::shared_ptr<EmitState> state, std::shared_ptr<INotificationHandler> handler,
                                                 std::shared_ptr<spdlog::logger> logger)
    {
      try
      {
        co_await handler->HandleAsync(state->Event);
      }
      catch (const std::exception& ex)
      {
        ++state->FailureCount;
        logger->error("Notification handler failed for {}: {}", ToString(state->Kind), ex.what());
      }
      catch (...)
      {
        ++state->FailureCount;
        logger->error("Notification handler failed for {}: unknown exception", ToString(state->Kind));
      }
      state->Pending.Done();
    }
  }

  NotificationBus::NotificationBus()
    : m_logger(SpdLogHelper::GetLogger("Notifications"))
  {
  }

  bool NotificationBus::On(const NotificationKind kind, std::shared_ptr<INotificationHandler> handler)
  {
    if (!handler)
    {
      m_logger->warn("On: ignoring null handler for {}", ToString(kind));
      return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& handlers = m_handlers[kind];
    if (std::find(handlers.begin(), handlers.end(), handler) != handlers.end())
    {
      m_logger->debug("On: handler already subscribed to {}", ToString(kind));
      return false;
    }
    handlers.push_back(std::move(handler));
    m_logger->debug("Handler subscribed to {} (count={})", ToString(kind), handlers.size());
    return true;
  }

  bool NotificationBus::Off(const NotificationKind kind, const std::shared_ptr<INotificationHandler>& handler)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto itrFind = m_handlers.find(kind);
    if (itrFind == m_handlers.end())
    {
      return false;
    }

    auto& handlers = itrFind->second;
    auto itrHandler = std::find(handlers.begin(), handlers.end(), handler);
    if (itrHandler == handlers.end())
    {
      return false;
    }
    handlers.erase(itrHandler);
    if (handlers.empty())
    {
      m_handlers.erase(itrFind);
    }
    m_logger->debug("Handler unsubscribed from {}", ToString(kind));
    return true;
  }

  boost::asio::awaitable<void> NotificationBus::EmitAsync(NotificationEvent event)
  {
    const auto kind = GetKind(event);
    auto handlers = Snapshot(kind);
    if (handlers.empty())
    {
      m_logger->trace("Emit {}: no handlers", ToString(kind));
      co_return;
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<EmitState>(std::move(event), executor);
    state->Pending.Add(handlers.size());

    m_logger->debug("Emit {}: {} handler(s)", ToString(kind), handlers.size());
    for (auto& handler : handlers)
    {
      // Spawned from the emitter's executor so every handler inherits the emitter's ambient state
      boost::asio::co_spawn(executor, RunHandlerAsync(state, std::move(handler), m_logger), boost::asio::detached);
    }

    co_await state->Pending.WaitAsync();

    if (state->FailureCount > 0)
    {
      m_logger->warn("Emit {}: {} of {} handler(s) failed", ToString(kind), state->FailureCount, handlers.size());
    }
  }

  NotificationBusStats NotificationBus::GetStats() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    NotificationBusStats stats;
    for (const auto& [kind, handlers] : m_handlers)
    {
      if (!handlers.empty())
      {
        stats.HandlersByKind.emplace(kind, handlers.size());
        stats.TotalHandlers += handlers.size();
      }
    }
    return stats;
  }

  void NotificationBus::Clear()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.clear();
    m_logger->debug("All notification handlers cleared");
  }

  std::vector<std::shared_ptr<INotificationHandler>> NotificationBus::Snapshot(const NotificationKind kind) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto itrFind = m_handlers.find(kind);
    if (itrFind == m_handlers.end())
    {
      return {};
    }
    return itrFind->second;
  }
}
