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

#include <Taskman/Async/CompletionSignal.hpp>
#include <Taskman/Common/SpdLogHelper.hpp>
#include <Taskman/Exception/TimeoutException.hpp>
#include <Taskman/Shutdown/ShutdownOrchestrator.hpp>
#include <Taskman/Timeout/TimeoutGuard.hpp>
#include <boost/asio/this_coro.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <exception>
#include <functional>

namespace Taskman
{
  namespace Internal
  {
    /// @brief Written by the cleanup sequence, which may outlive the run when the deadline wins.
    struct CleanupProgress
    {
      std::mutex Mutex;
      std::vector<ShutdownCleanupError> Errors;
      std::vector<ShutdownResourceTiming> Timings;
    };

    struct ShutdownRun
    {
      /// Guards Stats and Completed. Taken after the orchestrator's mutex when both are needed.
      std::mutex Mutex;
      /// Released when the run finishes. Joiners keep their own reference while they wait.
      std::shared_ptr<Async::CompletionSignal> Completed;
      std::shared_ptr<CleanupProgress> Progress{std::make_shared<CleanupProgress>()};
      ShutdownStats Stats;

      explicit ShutdownRun(const boost::asio::any_io_executor& executor)
        : Completed(std::make_shared<Async::CompletionSignal>(executor))
      {
      }
    };

    /// @brief Finishes the run from the first caller's frame if that frame is destroyed before it completes,
    ///        for example when its io_context is destroyed mid-shutdown.
    class ShutdownRunGuard
    {
      std::function<void()> m_onAbandoned;
      bool m_dismissed{false};

    public:
      explicit ShutdownRunGuard(std::function<void()> onAbandoned)
        : m_onAbandoned(std::move(onAbandoned))
      {
      }

      ShutdownRunGuard(const ShutdownRunGuard&) = delete;
      ShutdownRunGuard& operator=(const ShutdownRunGuard&) = delete;

      ~ShutdownRunGuard()
      {
        if (!m_dismissed)
        {
          m_onAbandoned();
        }
      }

      void Dismiss() noexcept
      {
        m_dismissed = true;
      }
    };
  }

  namespace
  {
    std::chrono::milliseconds ElapsedMs(const std::chrono::steady_clock::time_point startTime)
    {
      return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    }

    boost::asio::awaitable<void> RunSyncCleanupAsync(std::function<void()> cleanup)
    {
      cleanup();
      co_return;
    }

    boost::asio::awaitable<void> RunCleanupSequenceAsync(std::vector<ShutdownResource> resources, std::shared_ptr<Internal::CleanupProgress> progress,
                                                         std::shared_ptr<spdlog::logger> logger)
    {
      // Last registered, first cleaned up
      for (auto itr = resources.rbegin(); itr != resources.rend(); ++itr)
      {
        const auto& name = itr->Name;
        logger->info("Cleaning up resource: {}", name);
        const auto startTime = std::chrono::steady_clock::now();

        std::optional<std::string> error;
        try
        {
          co_await itr->Cleanup();
        }
        catch (const std::exception& ex)
        {
          error = ex.what();
        }
        catch (...)
        {
          error = "Unknown error";
        }

        const auto duration = ElapsedMs(startTime);
        std::lock_guard<std::mutex> lock(progress->Mutex);
        progress->Timings.push_back(ShutdownResourceTiming{name, duration, !error.has_value()});
        if (error)
        {
          logger->error("Error cleaning up resource: {} ({})", name, *error);
          progress->Errors.push_back(ShutdownCleanupError{name, std::move(*error)});
        }
        else
        {
          logger->info("Successfully cleaned up: {} ({}ms)", name, duration.count());
        }
      }
    }

    ShutdownStats FinishRun(Internal::ShutdownRun& run, const std::chrono::steady_clock::time_point startTime, const bool timedOut)
    {
      std::shared_ptr<Async::CompletionSignal> completed;
      ShutdownStats stats;
      {
        std::lock_guard<std::mutex> lock(run.Mutex);
        {
          std::lock_guard<std::mutex> progressLock(run.Progress->Mutex);
          run.Stats.Errors = run.Progress->Errors;
          run.Stats.Timings = run.Progress->Timings;
        }
        run.Stats.TimedOut = timedOut;
        run.Stats.EndTime = ShutdownClock::now();
        run.Stats.Duration = ElapsedMs(startTime);
        completed = std::move(run.Completed);
        stats = run.Stats;
      }
      if (completed)
      {
        completed->Set();
      }
      return stats;
    }
  }

  ShutdownOrchestrator::ShutdownOrchestrator(ShutdownOrchestratorConfig config)
    : m_config(config)
    , m_logger(SpdLogHelper::GetLogger("Shutdown"))
  {
  }

  ShutdownOrchestrator::~ShutdownOrchestrator() = default;

  bool ShutdownOrchestrator::RegisterResource(std::string name, CleanupFunction cleanup)
  {
    if (!cleanup)
    {
      m_logger->error("Cannot register resource without cleanup: {}", name);
      return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShuttingDown)
    {
      m_logger->warn("Cannot register resource during shutdown: {}", name);
      return false;
    }
    auto itrFind = std::find_if(m_resources.begin(), m_resources.end(), [&name](const ShutdownResource& entry) { return entry.Name == name; });
    if (itrFind != m_resources.end())
    {
      m_logger->warn("Resource already registered: {}", name);
      return false;
    }

    m_logger->debug("Registered resource: {}", name);
    m_resources.push_back(ShutdownResource{std::move(name), std::move(cleanup)});
    return true;
  }

  bool ShutdownOrchestrator::UnregisterResource(const std::string& name)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShuttingDown)
    {
      m_logger->warn("Cannot unregister resource during shutdown: {}", name);
      return false;
    }
    auto itrFind = std::find_if(m_resources.begin(), m_resources.end(), [&name](const ShutdownResource& entry) { return entry.Name == name; });
    if (itrFind == m_resources.end())
    {
      return false;
    }
    m_resources.erase(itrFind);
    m_logger->debug("Unregistered resource: {}", name);
    return true;
  }

  boost::asio::awaitable<ShutdownStats> ShutdownOrchestrator::ShutdownAsync()
  {
    auto executor = co_await boost::asio::this_coro::executor;

    std::shared_ptr<Internal::ShutdownRun> run;
    std::vector<ShutdownResource> resources;
    bool isFirstCall = false;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (!m_run)
      {
        m_isShuttingDown = true;
        m_run = std::make_shared<Internal::ShutdownRun>(executor);
        resources = m_resources;

        m_run->Stats.ResourceCount = resources.size();
        m_run->Stats.StartTime = ShutdownClock::now();
        for (const auto& resource : resources)
        {
          m_run->Stats.Resources.push_back(resource.Name);
        }
        isFirstCall = true;
      }
      run = m_run;
    }

    if (!isFirstCall)
    {
      m_logger->debug("Shutdown already initiated, joining it");
      std::shared_ptr<Async::CompletionSignal> completed;
      {
        std::lock_guard<std::mutex> lock(run->Mutex);
        completed = run->Completed;
      }
      if (completed)
      {
        co_await completed->WaitAsync();
      }
      ShutdownStats stats;
      {
        std::lock_guard<std::mutex> lock(run->Mutex);
        stats = run->Stats;
      }
      co_return stats;
    }

    m_logger->info("Initiating graceful shutdown: resourceCount={} resources=[{}]", run->Stats.ResourceCount, fmt::join(run->Stats.Resources, ", "));
    const auto startTime = std::chrono::steady_clock::now();

    Internal::ShutdownRunGuard abandonGuard(
      [run, startTime, logger = m_logger]()
      {
        try
        {
          logger->warn("Shutdown abandoned before every cleanup finished");
          FinishRun(*run, startTime, false);
        }
        catch (const std::exception& ex)
        {
          logger->error("Failed to finish the abandoned shutdown: {}", ex.what());
        }
      });

    auto cleanupSequence = [resources = std::move(resources), progress = run->Progress, logger = m_logger]()
    { return RunCleanupSequenceAsync(resources, progress, logger); };
    std::string operationName("shutdown");

    bool timedOut = false;
    try
    {
      co_await WithTimeout(std::move(cleanupSequence), m_config.Timeout, std::move(operationName));
    }
    catch (const TimeoutException& ex)
    {
      timedOut = true;
      m_logger->error("Timeout exceeded ({}ms), abandoning the remaining cleanups: {}", ex.GetTimeoutMs(), ex.what());
    }
    catch (const std::exception& ex)
    {
      m_logger->error("Cleanup sequence aborted: {}", ex.what());
    }

    abandonGuard.Dismiss();
    auto stats = FinishRun(*run, startTime, timedOut);

    m_logger->info("Shutdown complete: durationMs={} errorCount={} timedOut={}", stats.Duration.count(), stats.Errors.size(), timedOut);
    for (const auto& error : stats.Errors)
    {
      m_logger->warn("  {}: {}", error.Resource, error.Error);
    }
    co_return stats;
  }

  std::vector<std::string> ShutdownOrchestrator::GetRegisteredResources() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_resources.size());
    for (const auto& resource : m_resources)
    {
      names.push_back(resource.Name);
    }
    return names;
  }

  bool ShutdownOrchestrator::IsShutdownInProgress() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_isShuttingDown;
  }

  bool ShutdownOrchestrator::IsShutdownComplete() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_run)
    {
      return false;
    }
    std::lock_guard<std::mutex> runLock(m_run->Mutex);
    return m_run->Stats.EndTime.has_value();
  }

  std::optional<ShutdownStats> ShutdownOrchestrator::GetStats() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_run)
    {
      return std::nullopt;
    }

    std::lock_guard<std::mutex> runLock(m_run->Mutex);
    ShutdownStats stats = m_run->Stats;
    if (!stats.EndTime)
    {
      std::lock_guard<std::mutex> progressLock(m_run->Progress->Mutex);
      stats.Errors = m_run->Progress->Errors;
      stats.Timings = m_run->Progress->Timings;
    }
    return stats;
  }

  bool ShutdownOrchestrator::Reset()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_run)
    {
      std::lock_guard<std::mutex> runLock(m_run->Mutex);
      if (!m_run->Stats.EndTime)
      {
        m_logger->warn("Cannot reset during shutdown");
        return false;
      }
    }
    m_resources.clear();
    m_run.reset();
    m_isShuttingDown = false;
    return true;
  }

  CleanupFunction ShutdownOrchestrator::MakeSyncCleanup(std::function<void()> cleanup)
  {
    return [cleanup = std::move(cleanup)]() { return RunSyncCleanupAsync(cleanup); };
  }
}
