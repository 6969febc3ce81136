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

#include <Taskman/Common/SpdLogHelper.hpp>
#include <Taskman/Server/ShutdownSignalListener.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <csignal>
#include <cstdlib>
#include <utility>

namespace Taskman
{
  ShutdownSignalListener::ShutdownSignalListener(const boost::asio::any_io_executor& executor, ShutdownOrchestrator& orchestrator,
                                                 CompletionHandler onComplete, ForceExitHandler onForceExit)
    : m_signals(executor, SIGINT, SIGTERM)
    , m_orchestrator(orchestrator)
    , m_onComplete(std::move(onComplete))
    , m_onForceExit(std::move(onForceExit))
    , m_logger(SpdLogHelper::GetLogger("Server"))
  {
    if (!m_onForceExit)
    {
      m_onForceExit = [](const int signalNumber) { std::_Exit(128 + signalNumber); };
    }
  }

  void ShutdownSignalListener::Start()
  {
    boost::asio::co_spawn(m_signals.get_executor(), ListenAsync(), boost::asio::detached);
  }

  void ShutdownSignalListener::Cancel()
  {
    m_cancelled = true;
    boost::system::error_code ec;
    m_signals.cancel(ec);
    if (ec)
    {
      m_logger->warn("Failed to cancel signal listener: {}", ec.message());
    }
  }

  boost::asio::awaitable<void> ShutdownSignalListener::ListenAsync()
  {
    if (m_cancelled)
    {
      co_return;
    }
    boost::system::error_code ec;
    const int signalNumber = co_await m_signals.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
    {
      // operation_aborted when Cancel() was called
      m_logger->debug("Signal listener stopped: {}", ec.message());
      co_return;
    }

    m_triggered = true;
    m_logger->info("Received signal {}, shutting down", signalNumber);
    boost::asio::co_spawn(m_signals.get_executor(), WatchForceExitAsync(), boost::asio::detached);

    const auto stats = co_await m_orchestrator.ShutdownAsync();
    m_shutdownFinished = true;
    m_signals.cancel(ec);
    if (ec)
    {
      m_logger->warn("Failed to cancel signal listener: {}", ec.message());
    }
    if (m_onComplete)
    {
      m_onComplete(stats);
    }
  }

  boost::asio::awaitable<void> ShutdownSignalListener::WatchForceExitAsync()
  {
    boost::system::error_code ec;
    const int signalNumber = co_await m_signals.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec || m_shutdownFinished)
    {
      co_return;
    }
    m_logger->error("Received signal {} while shutting down, forcing exit", signalNumber);
    m_onForceExit(signalNumber);
  }
}
