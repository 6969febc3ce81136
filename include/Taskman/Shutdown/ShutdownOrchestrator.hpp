#ifndef TASKMAN_SHUTDOWN_SHUTDOWNORCHESTRATOR_HPP
#define TASKMAN_SHUTDOWN_SHUTDOWNORCHESTRATOR_HPP
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

#include <Taskman/Async/AmbientSpawn.hpp>
#include <Taskman/Shutdown/ShutdownOrchestratorConfig.hpp>
#include <Taskman/Shutdown/ShutdownTypes.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <spdlog/logger.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace Taskman
{
  namespace Internal
  {
    struct ShutdownRun;
  }

  /// @brief Registry of named cleanups that are run exactly once when the process terminates.
  ///
  /// ShutdownAsync is the only way to tear the registered resources down:
  /// 1. Registration is closed.
  /// 2. Cleanups run one after the other in reverse registration order.
  /// 3. A failing cleanup is recorded in ShutdownStats::Errors and the sequence continues.
  /// 4. The whole sequence is raced against ShutdownOrchestratorConfig::Timeout. When the deadline wins the
  ///    shutdown completes with TimedOut set while the unfinished cleanups are left running.
  ///
  /// Calling ShutdownAsync again (also while the first call is still running) never reruns anything, it
  /// waits for the first run and returns the same stats.
  ///
  /// ShutdownAsync must be called from a single-threaded executor. Registration and the introspection
  /// members may be called from any thread.
  class ShutdownOrchestrator
  {
    ShutdownOrchestratorConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::mutex m_mutex;
    std::vector<ShutdownResource> m_resources;
    bool m_isShuttingDown{false};
    std::shared_ptr<Internal::ShutdownRun> m_run;

  public:
    explicit ShutdownOrchestrator(ShutdownOrchestratorConfig config = {});
    ~ShutdownOrchestrator();

    ShutdownOrchestrator(const ShutdownOrchestrator&) = delete;
    ShutdownOrchestrator& operator=(const ShutdownOrchestrator&) = delete;
    ShutdownOrchestrator(ShutdownOrchestrator&&) = delete;
    ShutdownOrchestrator& operator=(ShutdownOrchestrator&&) = delete;

    const ShutdownOrchestratorConfig& GetConfig() const noexcept
    {
      return m_config;
    }

    /// @brief Adds a cleanup.
    /// @return false (and logs why) if shutdown has begun, the name is already registered or @p cleanup is empty.
    bool RegisterResource(std::string name, CleanupFunction cleanup);

    /// @brief Adds a cleanup given as any callable, synchronous or returning boost::asio::awaitable<void>.
    template <typename Func>
    bool RegisterResource(std::string name, Func cleanup)
    {
      if constexpr (Async::IsAwaitableV<std::invoke_result_t<Func&>>)
      {
        return RegisterResource(std::move(name), CleanupFunction(std::move(cleanup)));
      }
      else
      {
        return RegisterResource(std::move(name), MakeSyncCleanup(std::function<void()>(std::move(cleanup))));
      }
    }

    /// @return false if shutdown has begun or no resource called @p name is registered.
    bool UnregisterResource(const std::string& name);

    /// @brief Runs the shutdown, or joins the one that is already running or finished.
    boost::asio::awaitable<ShutdownStats> ShutdownAsync();

    /// @brief Names in registration order.
    std::vector<std::string> GetRegisteredResources() const;

    /// @brief True from the moment shutdown begins, also after it has completed (until Reset).
    bool IsShutdownInProgress() const;

    bool IsShutdownComplete() const;

    /// @brief Stats of the current or finished run; nullopt before shutdown. While the run is in flight EndTime is not set.
    std::optional<ShutdownStats> GetStats() const;

    /// @brief Forgets every resource and the previous run so the orchestrator can be reused.
    /// @return false (and logs why) while a shutdown is running.
    bool Reset();

  private:
    static CleanupFunction MakeSyncCleanup(std::function<void()> cleanup);
  };
}

#endif
