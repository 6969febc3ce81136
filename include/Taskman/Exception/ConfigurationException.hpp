#ifndef TASKMAN_EXCEPTION_CONFIGURATIONEXCEPTION_HPP
#define TASKMAN_EXCEPTION_CONFIGURATIONEXCEPTION_HPP
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

#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Taskman
{
  /// @brief Exception thrown when a configuration value can not be used.
  class ConfigurationException : public std::invalid_argument
  {
    std::string m_key;

  public:
    ConfigurationException(std::string_view key, std::string_view value, std::string_view reason)
      : std::invalid_argument(fmt::format("Invalid value '{}' for {}: {}", value, key, reason))
      , m_key(key)
    {
    }

    const std::string& GetKey() const noexcept
    {
      return m_key;
    }
  };
}

#endif
