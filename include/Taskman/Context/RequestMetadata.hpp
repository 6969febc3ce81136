#ifndef TASKMAN_CONTEXT_REQUESTMETADATA_HPP
#define TASKMAN_CONTEXT_REQUESTMETADATA_HPP
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

#include <Taskman/Common/ScalarValue.hpp>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace Taskman
{
  using MetadataValue = ScalarValue;

  /// @brief Free-form request metadata; keys keep their first insertion order.
  class RequestMetadata
  {
  public:
    using Entry = std::pair<std::string, MetadataValue>;

  private:
    std::vector<Entry> m_entries;

  public:
    RequestMetadata() = default;

    RequestMetadata(std::initializer_list<Entry> entries)
    {
      for (const auto& entry : entries)
      {
        Set(entry.first, entry.second);
      }
    }

    /// @brief Adds @p key or overwrites its value in place.
    void Set(std::string key, MetadataValue value);

    void Set(std::string key, const char* value)
    {
      Set(std::move(key), MetadataValue(std::string(value)));
    }

    /// @brief Adds the keys of @p patch, overwriting existing ones. Keys not present in @p patch are kept.
    void Merge(const RequestMetadata& patch);

    const MetadataValue* Find(const std::string& key) const noexcept;

    bool Contains(const std::string& key) const noexcept
    {
      return Find(key) != nullptr;
    }

    std::vector<std::string> GetKeys() const;

    std::size_t Size() const noexcept
    {
      return m_entries.size();
    }

    bool IsEmpty() const noexcept
    {
      return m_entries.empty();
    }

    std::vector<Entry>::const_iterator begin() const noexcept
    {
      return m_entries.begin();
    }

    std::vector<Entry>::const_iterator end() const noexcept
    {
      return m_entries.end();
    }

    bool operator==(const RequestMetadata& rhs) const = default;
  };
}

#endif
