#ifndef TASKMAN_NOTIFICATION_NOTIFICATIONBUS_HPP
#define TASKMAN_NOTIFICATION_NOTIFICATIONBUS_HPP
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

#include <Taskman/Notification/INotificationHandler.hpp>
#include <Taskman/Notification/NotificationEvent.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <spdlog/logger.h>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace Taskman
{
  struct NotificationBusStats
  {
    std::size_t TotalHandlers{0};
    /// Only kinds with at least one handler are present.
    std::map<NotificationKind, std::size_t> HandlersByKind;
  };

  /// @brief In-process publish/subscribe registry for domain events.
  ///
  /// EmitAsync works on a snapshot of the handlers subscribed when it starts. All of them run
  /// concurrently as child tasks of the emitting task (so they observe its request context and active
  /// span) and EmitAsync returns once every one of them has finished. A failing handler is logged and
  /// never affects its siblings or the emitter.
  ///
  /// Subscription management is thread safe.
  class NotificationBus
  {
    mutable std::mutex m_mutex;
    std::map<NotificationKind, std::vector<std::shared_ptr<INotificationHandler>>> m_handlers;
    std::shared_ptr<spdlog::logger> m_logger;

  public:
    NotificationBus();

    NotificationBus(const NotificationBus&) = delete;
    NotificationBus& operator=(const NotificationBus&) = delete;

    /// @brief Subscribes @p handler to @p kind.
    /// @return false if @p handler is null or already subscribed to @p kind.
    bool On(NotificationKind kind, std::shared_ptr<INotificationHandler> handler);

    /// @brief Unsubscribes @p handler from @p kind.
    /// @return false if it was not subscribed.
    bool Off(NotificationKind kind, const std::shared_ptr<INotificationHandler>& handler);

    /// @brief Delivers @p event to every handler subscribed to its kind and waits for all of them. Never throws
    ///        because of a handler.
    boost::asio::awaitable<void> EmitAsync(NotificationEvent event);

    NotificationBusStats GetStats() const;

    /// @brief Removes every subscription.
    void Clear();

  private:
    std::vector<std::shared_ptr<INotificationHandler>> Snapshot(NotificationKind kind) const;
  };
}

#endif
