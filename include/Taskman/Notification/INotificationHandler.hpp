#ifndef TASKMAN_NOTIFICATION_INOTIFICATIONHANDLER_HPP
#define TASKMAN_NOTIFICATION_INOTIFICATIONHANDLER_HPP
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
#include <Taskman/Notification/NotificationEvent.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace Taskman
{
  /// @brief Observer of domain events. A handler is identified by its address.
  class INotificationHandler
  {
  public:
    virtual ~INotificationHandler() = default;

    /// @brief Handles one event. Exceptions are contained and logged by the bus.
    virtual boost::asio::awaitable<void> HandleAsync(const NotificationEvent& event) = 0;
  };

  namespace Internal
  {
    template <typename Func>
    class CallbackNotificationHandler final : public INotificationHandler
    {
      Func m_func;

    public:
      explicit CallbackNotificationHandler(Func func)
        : m_func(std::move(func))
      {
      }

      boost::asio::awaitable<void> HandleAsync(const NotificationEvent& event) override
      {
        if constexpr (Async::IsAwaitableV<std::invoke_result_t<Func&, const NotificationEvent&>>)
        {
          co_await m_func(event);
        }
        else
        {
          m_func(event);
          co_return;
        }
      }
    };
  }

  /// @brief Adapts a callable taking `const NotificationEvent&` into a handler.
  ///
  /// The callable may be synchronous or return boost::asio::awaitable<void>. Keep the returned pointer
  /// to unsubscribe later.
  template <typename Func>
  std::shared_ptr<INotificationHandler> MakeNotificationHandler(Func func)
  {
    return std::make_shared<Internal::CallbackNotificationHandler<Func>>(std::move(func));
  }
}

#endif
