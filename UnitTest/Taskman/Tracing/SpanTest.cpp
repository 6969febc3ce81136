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

#include <Taskman/Tracing/InMemoryTracer.hpp>
#include <Taskman/Tracing/SemanticAttributes.hpp>
#include <Taskman/Tracing/Span.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace Taskman
{
  namespace
  {
    std::shared_ptr<Span> MakeSpan(Span::EndCallback onEnd = {})
    {
      return std::make_shared<Span>("unit", SpanContext{"trace", "span"}, std::nullopt, SpanAttributes{}, std::move(onEnd));
    }
  }

  // ============================================================================
  // Span
  // ============================================================================

  TEST(SpanTest, End_OnlyFirstCallHasEffect)
  {
    int endCount = 0;
    auto span = MakeSpan([&endCount](const std::shared_ptr<const Span>&) { ++endCount; });

    span->End();
    const auto endTime = span->GetEndTime();
    span->End();

    EXPECT_FALSE(span->IsRecording());
    EXPECT_EQ(endCount, 1);
    EXPECT_EQ(span->GetEndTime(), endTime);
  }

  TEST(SpanTest, Mutations_AfterEnd_AreIgnored)
  {
    auto span = MakeSpan();
    span->SetAttribute("before", std::int64_t{1});
    span->End();

    span->SetAttribute("after", std::int64_t{2});
    span->AddEvent("late");
    span->SetStatus(SpanStatus{SpanStatusCode::Error, "late"});
    span->RecordException(RecordedException{"type", "message"});

    EXPECT_TRUE(span->GetAttribute("before").has_value());
    EXPECT_FALSE(span->GetAttribute("after").has_value());
    EXPECT_TRUE(span->GetEvents().empty());
    EXPECT_EQ(span->GetStatus().Code, SpanStatusCode::Unset);
    EXPECT_TRUE(span->GetExceptions().empty());
  }

  TEST(SpanTest, RecordException_AddsExceptionEvent)
  {
    auto span = MakeSpan();

    span->RecordException(RecordedException{"std::runtime_error", "boom"});

    const auto events = span->GetEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].Name, "exception");
    EXPECT_EQ(std::get<std::string>(events[0].Attributes.at("exception.type")), "std::runtime_error");
    EXPECT_EQ(std::get<std::string>(events[0].Attributes.at("exception.message")), "boom");
    EXPECT_EQ(std::get<std::string>(events[0].Attributes.at("exception.stacktrace")), RecordedException::NoStackTrace);
    ASSERT_EQ(span->GetExceptions().size(), 1u);
  }

  TEST(SpanTest, CreateNoop_IsEndedAndInvalid)
  {
    auto span = Span::CreateNoop();
    span->SetAttribute("ignored", true);

    EXPECT_FALSE(span->IsRecording());
    EXPECT_FALSE(span->GetContext().IsValid());
    EXPECT_TRUE(span->GetAttributes().empty());
  }

  TEST(SpanTest, DescribeException_StdException_UsesTypeAndMessage)
  {
    const auto recorded = DescribeException(std::make_exception_ptr(std::invalid_argument("bad")));

    EXPECT_EQ(recorded.Type, "std::invalid_argument");
    EXPECT_EQ(recorded.Message, "bad");
    EXPECT_EQ(recorded.Stack, RecordedException::NoStackTrace);
  }

  TEST(SpanTest, DescribeException_NonStdException_IsUnknown)
  {
    const auto recorded = DescribeException(std::make_exception_ptr(42));

    EXPECT_EQ(recorded.Type, "unknown");
  }

  // ============================================================================
  // InMemoryTracer
  // ============================================================================

  TEST(InMemoryTracerTest, StartSpan_AddsServiceAttributes)
  {
    InMemoryTracer tracer("svc", "9.9.9");

    auto span = tracer.StartSpan("op", SpanAttributes{}, nullptr);

    EXPECT_EQ(std::get<std::string>(*span->GetAttribute(SemanticAttributes::ServiceName)), "svc");
    EXPECT_EQ(std::get<std::string>(*span->GetAttribute(SemanticAttributes::ServiceVersion)), "9.9.9");
    EXPECT_EQ(span->GetContext().TraceId.size(), 32u);
    EXPECT_EQ(span->GetContext().SpanId.size(), 16u);
    EXPECT_FALSE(span->GetParentSpanId().has_value());
  }

  TEST(InMemoryTracerTest, StartSpan_WithParent_InheritsTraceId)
  {
    InMemoryTracer tracer;

    auto parent = tracer.StartSpan("parent", SpanAttributes{}, nullptr);
    auto child = tracer.StartSpan("child", SpanAttributes{}, parent);

    EXPECT_EQ(child->GetContext().TraceId, parent->GetContext().TraceId);
    EXPECT_NE(child->GetContext().SpanId, parent->GetContext().SpanId);
    EXPECT_EQ(child->GetParentSpanId(), std::optional<std::string>(parent->GetContext().SpanId));
  }

  TEST(InMemoryTracerTest, End_StoresFinishedSpanAndRespectsCapacity)
  {
    InMemoryTracer tracer("svc", "1", 2);

    for (const char* name : {"a", "b", "c"})
    {
      tracer.StartSpan(name, SpanAttributes{}, nullptr)->End();
    }

    const auto finished = tracer.GetFinishedSpans();
    ASSERT_EQ(finished.size(), 2u);
    EXPECT_EQ(finished[0]->GetName(), "b");
    EXPECT_EQ(finished[1]->GetName(), "c");
    EXPECT_EQ(tracer.FindFinishedSpan("a"), nullptr);
    EXPECT_NE(tracer.FindFinishedSpan("c"), nullptr);

    tracer.Clear();
    EXPECT_TRUE(tracer.GetFinishedSpans().empty());
  }

  TEST(InMemoryTracerTest, SpanEndedAfterTracerDestroyed_DoesNotCrash)
  {
    std::shared_ptr<Span> span;
    {
      InMemoryTracer tracer;
      span = tracer.StartSpan("orphan", SpanAttributes{}, nullptr);
    }

    EXPECT_NO_THROW(span->End());
    EXPECT_FALSE(span->IsRecording());
  }
}
