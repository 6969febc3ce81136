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

#include <Taskman/Logging/LogRedaction.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace Taskman::LogRedaction
{
  namespace
  {
    constexpr std::array<std::string_view, 7> SensitiveKeys = {"password", "token", "authorization", "cookie", "secret", "apikey", "api_key"};

    bool EqualsIgnoreCase(const std::string_view lhs, const std::string_view rhs)
    {
      return lhs.size() == rhs.size() &&
             std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                        [](const unsigned char a, const unsigned char b) { return std::tolower(a) == std::tolower(b); });
    }
  }

  bool IsSensitiveField(std::string_view key)
  {
    const auto lastDot = key.rfind('.');
    if (lastDot != std::string_view::npos)
    {
      key.remove_prefix(lastDot + 1);
    }
    return std::any_of(SensitiveKeys.begin(), SensitiveKeys.end(), [key](const std::string_view entry) { return EqualsIgnoreCase(key, entry); });
  }

  std::string_view MaskValue(const std::string_view key, const std::string_view value)
  {
    return IsSensitiveField(key) ? std::string_view(RedactedValue) : value;
  }
}
