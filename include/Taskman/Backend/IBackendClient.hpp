#ifndef TASKMAN_BACKEND_IBACKENDCLIENT_HPP
#define TASKMAN_BACKEND_IBACKENDCLIENT_HPP
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

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <string>

namespace Taskman
{
  struct BackendRequest
  {
    std::string Method{"GET"};
    /// Path relative to the backend base url, for example "/api/v1/tasks/T-1".
    std::string Path;
    std::string Body;
  };

  struct BackendResponse
  {
    int StatusCode{0};
    std::string Body;
  };

  /// @brief Outbound REST client used by the tool handlers. The transport lives outside this library.
  class IBackendClient
  {
  public:
    virtual ~IBackendClient() = default;

    /// @throws Whatever the transport throws; HTTP error statuses are returned, not thrown.
    virtual boost::asio::awaitable<BackendResponse> SendAsync(BackendRequest request) = 0;
  };
}

#endif
