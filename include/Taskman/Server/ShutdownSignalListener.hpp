#ifndef TASKMAN_SERVER_SHUTDOWNSIGNALLISTENER_HPP
#define TASKMAN_SERVER_SHUTDOWNSIGNALLISTENER_HPP
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

#include <Taskman/Shutdown/ShutdownOrchestrator.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/logger.h>
#include <functional>
#include <memory>

namespace Taskman
{
  /// @brief Turns the first SIGINT/SIGTERM into exactly one ShutdownOrchestrator::ShutdownAsync call.
  ///
  /// While that shutdown runs the signal set stays armed: a second signal calls the force exit handler, which by
  /// default terminates the process with status 128 + signal. Once the shutdown has finished the wait is cancelled.
  class ShutdownSignalListener
  {
  public:
    using CompletionHandler = std::function<void(const ShutdownStats&)>;
    using ForceExitHandler = std::function<void(int signalNumber)>;

  private:
    boost::asio::signal_set m_signals;
    ShutdownOrchestrator& m_orchestrator;
    CompletionHandler m_onComplete;
    ForceExitHandler m_onForceExit;
    std::shared_ptr<spdlog::logger> m_logger;
    bool m_triggered{false};
    bool m_cancelled{false};
    bool m_shutdownFinished{false};

  public:
    /// @param onComplete Called with the stats once the shutdown has finished (for example to stop the io_context).
    /// @param onForceExit Called for a signal that arrives while the shutdown is still running. Empty selects std::_Exit.
    ShutdownSignalListener(const boost::asio::any_io_executor& executor, ShutdownOrchestrator& orchestrator, CompletionHandler onComplete,
                           ForceExitHandler onForceExit = {});

    ShutdownSignalListener(const ShutdownSignalListener&) = delete;
    ShutdownSignalListener& operator=(const ShutdownSignalListener&) = delete;

    /// @brief Starts listening in a detached task.
    void Start();

    /// @brief Stops listening, also when the listener task has not started waiting yet. Does not affect a shutdown
    ///        that is already running.
    void Cancel();

    bool HasTriggered() const noexcept
    {
      return m_triggered;
    }

  private:
    boost::asio::awaitable<void> ListenAsync();
    boost::asio::awaitable<void> WatchForceExitAsync();
  };
}

#endif
