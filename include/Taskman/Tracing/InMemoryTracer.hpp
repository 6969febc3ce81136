#ifndef TASKMAN_TRACING_INMEMORYTRACER_HPP
#define TASKMAN_TRACING_INMEMORYTRACER_HPP
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

#include <Taskman/Tracing/ITracer.hpp>
#include <spdlog/logger.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Taskman
{
  /// @brief Tracer that keeps finished spans in memory and logs them at debug level.
  ///
  /// Used as the default exporter and for inspection in tests. Every span is tagged with
  /// service.name and service.version. The oldest finished spans are discarded once @p maxFinishedSpans is reached.
  class InMemoryTracer final : public ITracer
  {
    struct State
    {
      std::mutex Mutex;
      std::vector<std::shared_ptr<const Span>> FinishedSpans;
    };

    std::string m_serviceName;
    std::string m_serviceVersion;
    std::size_t m_maxFinishedSpans;
    std::shared_ptr<State> m_state;
    std::shared_ptr<spdlog::logger> m_logger;

  public:
    static constexpr std::size_t DefaultMaxFinishedSpans = 1024;

    explicit InMemoryTracer(std::string serviceName = "taskman-mcp", std::string serviceVersion = "0.1.0",
                            std::size_t maxFinishedSpans = DefaultMaxFinishedSpans);

    std::shared_ptr<Span> StartSpan(const std::string& name, const SpanAttributes& attributes, const std::shared_ptr<const Span>& parent) override;

    std::vector<std::shared_ptr<const Span>> GetFinishedSpans() const;

    /// @brief The most recently finished span called @p name, or nullptr.
    std::shared_ptr<const Span> FindFinishedSpan(const std::string& name) const;

    void Clear();
  };
}

#endif
