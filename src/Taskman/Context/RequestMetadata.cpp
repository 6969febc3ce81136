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

#include <Taskman/Context/RequestMetadata.hpp>

namespace Taskman
{
  void RequestMetadata::Set(std::string key, MetadataValue value)
  {
    for (auto& entry : m_entries)
    {
      if (entry.first == key)
      {
        entry.second = std::move(value);
        return;
      }
    }
    m_entries.emplace_back(std::move(key), std::move(value));
  }

  void RequestMetadata::Merge(const RequestMetadata& patch)
  {
    for (const auto& [key, value] : patch.m_entries)
    {
      Set(key, value);
    }
  }

  const MetadataValue* RequestMetadata::Find(const std::string& key) const noexcept
  {
    for (const auto& entry : m_entries)
    {
      if (entry.first == key)
      {
        return &entry.second;
      }
    }
    return nullptr;
  }

  std::vector<std::string> RequestMetadata::GetKeys() const
  {
    std::vector<std::string> keys;
    keys.reserve(m_entries.size());
    for (const auto& entry : m_entries)
    {
      keys.push_back(entry.first);
    }
    return keys;
  }
}
