#ifndef TASKMAN_TRACING_ITRACER_HPP
#define TASKMAN_TRACING_ITRACER_HPP
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

#include <Taskman/Tracing/Span.hpp>
#include <memory>
#include <string>

namespace Taskman
{
  /// @brief Tracing backend collaborator: starts spans that are exported once they end.
  class ITracer
  {
  public:
    virtual ~ITracer() = default;

    /// @brief Starts a recording span.
    /// @param name The span name.
    /// @param attributes Initial attributes.
    /// @param parent The parent span or nullptr for a new trace. A parent with an invalid context also starts a new trace.
    virtual std::shared_ptr<Span> StartSpan(const std::string& name, const SpanAttributes& attributes, const std::shared_ptr<const Span>& parent) = 0;
  };
}

#endif
