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
#include <Taskman/Server/ServerHost.hpp>
#include <Taskman/Server/ShutdownSignalListener.hpp>
#include <utility>

namespace Taskman
{
  ServerHost::ServerHost(CoreConfig config)
    : m_config(std::move(config))
    , m_logger(SpdLogHelper::GetLogger("Server"))
    , m_tracer(std::make_shared<InMemoryTracer>(m_config.ServiceName, m_config.ServiceVersion))
    , m_spans(m_tracer)
    , m_shutdown(m_config.Shutdown)
    , m_tools(m_contexts, m_spans, m_config.ToolTimeout)
  {
    RegisterCoreResources();
    m_logger->debug("ServerHost: constructed");
  }

  ServerHost::~ServerHost() = default;

  int ServerHost::Run()
  {
    m_logger->info("{} {} starting: transport={} toolTimeout={}ms shutdownTimeout={}ms", m_config.ServiceName, m_config.ServiceVersion,
                   ToString(m_config.Logging.Transport), m_config.ToolTimeout.count(), m_config.Shutdown.Timeout.count());

    ShutdownSignalListener listener(m_ioContext.get_executor(), m_shutdown,
                                    [this](const ShutdownStats& stats)
                                    {
                                      m_lastShutdownStats = stats;
                                      m_ioContext.stop();
                                    });
    listener.Start();

    // Keep running while only the transport (which lives outside the core) has work pending
    auto workGuard = boost::asio::make_work_guard(m_ioContext);
    m_ioContext.run();

    if (!m_lastShutdownStats)
    {
      m_logger->warn("io_context stopped without a completed shutdown");
      return 1;
    }
    const bool clean = !m_lastShutdownStats->HasErrors() && !m_lastShutdownStats->TimedOut;
    m_logger->info("{} stopped: errors={} timedOut={}", m_config.ServiceName, m_lastShutdownStats->Errors.size(), m_lastShutdownStats->TimedOut);
    return clean ? 0 : 1;
  }

  void ServerHost::RegisterCoreResources()
  {
    // Registered first so it is cleaned up last: spans of the other cleanups are still exported
    m_shutdown.RegisterResource("tracer",
                                [this]()
                                {
                                  const auto finished = m_tracer->GetFinishedSpans().size();
                                  m_tracer->Clear();
                                  m_logger->debug("Tracer flushed {} finished span(s)", finished);
                                });
    m_shutdown.RegisterResource("notification-bus",
                                [this]()
                                {
                                  const auto stats = m_notifications.GetStats();
                                  m_notifications.Clear();
                                  m_logger->debug("Notification bus cleared {} handler(s)", stats.TotalHandlers);
                                });
    m_shutdown.RegisterResource("tool-dispatcher",
                                [this]()
                                {
                                  const auto count = m_tools.UnregisterAllTools();
                                  m_logger->debug("Tool dispatcher released {} tool(s)", count);
                                });
  }
}
