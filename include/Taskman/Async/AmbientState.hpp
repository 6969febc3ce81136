#ifndef TASKMAN_ASYNC_AMBIENTSTATE_HPP
#define TASKMAN_ASYNC_AMBIENTSTATE_HPP
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

#include <memory>
#include <utility>

namespace Taskman::Async
{
  /// @brief Immutable chain of task-local values.
  ///
  /// An AmbientState is a persistent singly linked list of (key, value) nodes. Binding a new value
  /// produces a new state that shares the tail with the old one, so handing a state to a child task
  /// is a pointer copy and the parent's view can never be modified by the child.
  ///
  /// The state that belongs to the currently running logical task is installed on the thread by
  /// AmbientScope (see AmbientExecutor for how it follows a coroutine across suspension points).
  class AmbientState
  {
    struct Node
    {
      const void* Key{nullptr};
      std::shared_ptr<void> Value;
      std::shared_ptr<const Node> Next;
    };

    std::shared_ptr<const Node> m_head;

    explicit AmbientState(std::shared_ptr<const Node> head) noexcept
      : m_head(std::move(head))
    {
    }

  public:
    AmbientState() noexcept = default;

    /// @brief Returns a new state where @p key maps to @p value, shadowing any older binding.
    [[nodiscard]] AmbientState With(const void* key, std::shared_ptr<void> value) const
    {
      auto node = std::make_shared<Node>();
      node->Key = key;
      node->Value = std::move(value);
      node->Next = m_head;
      return AmbientState(std::move(node));
    }

    /// @brief Finds the most recent binding for @p key.
    /// @return The bound value or nullptr when the key is unbound (or bound to nullptr).
    [[nodiscard]] std::shared_ptr<void> Find(const void* key) const noexcept
    {
      for (const Node* node = m_head.get(); node != nullptr; node = node->Next.get())
      {
        if (node->Key == key)
        {
          return node->Value;
        }
      }
      return {};
    }

    [[nodiscard]] bool IsEmpty() const noexcept
    {
      return !m_head;
    }

    /// @brief The state installed on the calling thread (empty when no task scope is active).
    [[nodiscard]] static AmbientState Current() noexcept;

    friend bool operator==(const AmbientState& lhs, const AmbientState& rhs) noexcept
    {
      return lhs.m_head == rhs.m_head;
    }

    friend bool operator!=(const AmbientState& lhs, const AmbientState& rhs) noexcept
    {
      return !(lhs == rhs);
    }

  private:
    friend class AmbientScope;
    static AmbientState Exchange(AmbientState state) noexcept;
  };


  /// @brief Installs an AmbientState on the calling thread for the lifetime of the scope.
  ///
  /// Scopes nest strictly: the destructor restores exactly the state that was installed when the
  /// scope was entered.
  class AmbientScope
  {
    AmbientState m_previous;

  public:
    explicit AmbientScope(AmbientState state) noexcept
      : m_previous(AmbientState::Exchange(std::move(state)))
    {
    }

    ~AmbientScope()
    {
      AmbientState::Exchange(std::move(m_previous));
    }

    AmbientScope(const AmbientScope&) = delete;
    AmbientScope& operator=(const AmbientScope&) = delete;
    AmbientScope(AmbientScope&&) = delete;
    AmbientScope& operator=(AmbientScope&&) = delete;
  };


  /// @brief Typed key into an AmbientState.
  ///
  /// The slot's address is the key, so every owner (a context store, a span manager) gets its own
  /// independent binding even when several owners store the same value type.
  template <typename T>
  class AmbientSlot
  {
  public:
    AmbientSlot() noexcept = default;

    AmbientSlot(const AmbientSlot&) = delete;
    AmbientSlot& operator=(const AmbientSlot&) = delete;
    AmbientSlot(AmbientSlot&&) = delete;
    AmbientSlot& operator=(AmbientSlot&&) = delete;

    /// @brief Value bound in the calling thread's current state.
    [[nodiscard]] std::shared_ptr<T> Get() const noexcept
    {
      return Get(AmbientState::Current());
    }

    [[nodiscard]] std::shared_ptr<T> Get(const AmbientState& state) const noexcept
    {
      return std::static_pointer_cast<T>(state.Find(this));
    }

    /// @brief Derives a state from the current one with this slot bound to @p value.
    [[nodiscard]] AmbientState Bind(std::shared_ptr<T> value) const
    {
      return AmbientState::Current().With(this, std::move(value));
    }
  };
}

#endif
