#ifndef TASKMAN_NOTIFICATION_NOTIFICATIONEVENT_HPP
#define TASKMAN_NOTIFICATION_NOTIFICATIONEVENT_HPP
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

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace Taskman
{
  enum class NotificationKind
  {
    TaskCreated,
    TaskUpdated,
    TaskDeleted,
    LockAcquired,
    LockReleased,
    LockExpired,
    HealthDegraded,
    HealthRecovered
  };

  /// @brief The wire name of the kind, for example "lock:acquired".
  constexpr std::string_view ToString(const NotificationKind value) noexcept
  {
    switch (value)
    {
    case NotificationKind::TaskCreated:
      return "task:created";
    case NotificationKind::TaskUpdated:
      return "task:updated";
    case NotificationKind::TaskDeleted:
      return "task:deleted";
    case NotificationKind::LockAcquired:
      return "lock:acquired";
    case NotificationKind::LockReleased:
      return "lock:released";
    case NotificationKind::LockExpired:
      return "lock:expired";
    case NotificationKind::HealthDegraded:
      return "health:degraded";
    case NotificationKind::HealthRecovered:
      return "health:recovered";
    }
    return "unknown";
  }

  struct TaskCreatedEvent
  {
    static constexpr NotificationKind Kind = NotificationKind::TaskCreated;

    std::string TaskId;
    std::optional<std::string> ProjectId;

    bool operator==(const TaskCreatedEvent& rhs) const = default;
  };

  struct TaskUpdatedEvent
  {
    static constexpr NotificationKind Kind = NotificationKind::TaskUpdated;

    std::string TaskId;
    /// Names of the fields that changed.
    std::vector<std::string> Changes;

    bool operator==(const TaskUpdatedEvent& rhs) const = default;
  };

  struct TaskDeletedEvent
  {
    static constexpr NotificationKind Kind = NotificationKind::TaskDeleted;

    std::string TaskId;

    bool operator==(const TaskDeletedEvent& rhs) const = default;
  };

  struct LockAcquiredEvent
  {
    static constexpr NotificationKind Kind = NotificationKind::LockAcquired;

    std::string ObjectType;
    std::string ObjectId;
    std::string Agent;

    bool operator==(const LockAcquiredEvent& rhs) const = default;
  };

  struct LockReleasedEvent
  {
    static constexpr NotificationKind Kind = NotificationKind::LockReleased;

    std::string ObjectType;
    std::string ObjectId;
    std::string Agent;

    bool operator==(const LockReleasedEvent& rhs) const = default;
  };

  /// An expired lock no longer has a holder.
  struct LockExpiredEvent
  {
    static constexpr NotificationKind Kind = NotificationKind::LockExpired;

    std::string ObjectType;
    std::string ObjectId;

    bool operator==(const LockExpiredEvent& rhs) const = default;
  };

  struct HealthDegradedEvent
  {
    static constexpr NotificationKind Kind = NotificationKind::HealthDegraded;

    std::string Service;
    std::string Reason;

    bool operator==(const HealthDegradedEvent& rhs) const = default;
  };

  struct HealthRecoveredEvent
  {
    static constexpr NotificationKind Kind = NotificationKind::HealthRecovered;

    std::string Service;

    bool operator==(const HealthRecoveredEvent& rhs) const = default;
  };

  /// @brief Closed set of domain events. New kinds are added as new alternatives.
  using NotificationEvent = std::variant<TaskCreatedEvent, TaskUpdatedEvent, TaskDeletedEvent, LockAcquiredEvent, LockReleasedEvent,
                                         LockExpiredEvent, HealthDegradedEvent, HealthRecoveredEvent>;

  inline NotificationKind GetKind(const NotificationEvent& event) noexcept
  {
    return std::visit([](const auto& e) noexcept { return std::decay_t<decltype(e)>::Kind; }, event);
  }
}

#endif
