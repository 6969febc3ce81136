#ifndef TASKMAN_SERVER_SERVERHOST_HPP
#define TASKMAN_SERVER_SERVERHOST_HPP
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

#include <Taskman/Config/CoreConfig.hpp>
#include <Taskman/Context/RequestContextStore.hpp>
#include <Taskman/Notification/NotificationBus.hpp>
#include <Taskman/Server/ToolCallDispatcher.hpp>
#include <Taskman/Shutdown/ShutdownOrchestrator.hpp>
#include <Taskman/Tracing/InMemoryTracer.hpp>
#include <Taskman/Tracing/TracingSpanManager.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/logger.h>
#include <memory>
#include <optional>

namespace Taskman
{
  /// @brief Owns the io_context and the long-lived core services of the server process.
  ///
  /// Services are plain members handed out by reference; there are no process wide singletons.
  /// Construction order is the dependency order, destruction runs in reverse.
  ///
  /// Usage:
  /// 1. Construct with a loaded CoreConfig (after ConfigureLogging).
  /// 2. Register tools on GetToolDispatcher() and extra resources on GetShutdownOrchestrator().
  /// 3. Call Run(); it returns after a SIGINT/SIGTERM has been turned into a completed shutdown.
  class ServerHost
  {
    CoreConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    boost::asio::io_context m_ioContext;
    std::shared_ptr<InMemoryTracer> m_tracer;
    RequestContextStore m_contexts;
    TracingSpanManager m_spans;
    NotificationBus m_notifications;
    ShutdownOrchestrator m_shutdown;
    ToolCallDispatcher m_tools;
    std::optional<ShutdownStats> m_lastShutdownStats;

  public:
    explicit ServerHost(CoreConfig config);
    ~ServerHost();

    ServerHost(const ServerHost&) = delete;
    ServerHost& operator=(const ServerHost&) = delete;
    ServerHost(ServerHost&&) = delete;
    ServerHost& operator=(ServerHost&&) = delete;

    const CoreConfig& GetConfig() const noexcept
    {
      return m_config;
    }

    boost::asio::io_context& GetIoContext() noexcept
    {
      return m_ioContext;
    }

    const std::shared_ptr<InMemoryTracer>& GetTracer() const noexcept
    {
      return m_tracer;
    }

    RequestContextStore& GetRequestContextStore() noexcept
    {
      return m_contexts;
    }

    TracingSpanManager& GetSpanManager() noexcept
    {
      return m_spans;
    }

    NotificationBus& GetNotificationBus() noexcept
    {
      return m_notifications;
    }

    ShutdownOrchestrator& GetShutdownOrchestrator() noexcept
    {
      return m_shutdown;
    }

    ToolCallDispatcher& GetToolDispatcher() noexcept
    {
      return m_tools;
    }

    /// @brief Runs the io_context until a termination signal has been handled.
    /// @return 0 on a clean shutdown, 1 when cleanups failed or the shutdown timed out.
    int Run();

    /// @brief Stats of the shutdown performed by Run, if any.
    const std::optional<ShutdownStats>& GetLastShutdownStats() const noexcept
    {
      return m_lastShutdownStats;
    }

  private:
    void RegisterCoreResources();
  };
}

#endif
