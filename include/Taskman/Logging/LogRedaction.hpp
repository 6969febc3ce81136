#ifndef TASKMAN_LOGGING_LOGREDACTION_HPP
#define TASKMAN_LOGGING_LOGREDACTION_HPP
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

#include <string_view>

namespace Taskman
{
  namespace LogRedaction
  {
    inline constexpr const char* RedactedValue = "[REDACTED]";

    /// @brief True for password, token, authorization, cookie, secret, apiKey and api_key, compared
    ///        case-insensitively. For a dotted key such as "headers.authorization" the last segment is compared.
    bool IsSensitiveField(std::string_view key);

    /// @brief The value to write for @p key: RedactedValue for a sensitive key, @p value otherwise.
    std::string_view MaskValue(std::string_view key, std::string_view value);
  }
}

#endif
