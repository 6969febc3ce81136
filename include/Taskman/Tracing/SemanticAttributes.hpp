#ifndef TASKMAN_TRACING_SEMANTICATTRIBUTES_HPP
#define TASKMAN_TRACING_SEMANTICATTRIBUTES_HPP
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

#include <string_view>

/// Attribute keys shared by every span the server produces, following the OpenTelemetry conventions where one exists.
namespace Taskman::SemanticAttributes
{
  inline constexpr std::string_view ServiceName = "service.name";
  inline constexpr std::string_view ServiceVersion = "service.version";
  inline constexpr std::string_view ServiceInstanceId = "service.instance.id";

  inline constexpr std::string_view OperationName = "operation.name";
  inline constexpr std::string_view OperationStatus = "operation.status";
  inline constexpr std::string_view OperationDurationMs = "operation.duration_ms";

  inline constexpr std::string_view ErrorType = "error.type";
  inline constexpr std::string_view ErrorMessage = "error.message";
  inline constexpr std::string_view ErrorStack = "error.stack";

  inline constexpr std::string_view TaskId = "task.id";
  inline constexpr std::string_view TaskName = "task.name";
  inline constexpr std::string_view TaskStatus = "task.status";
  inline constexpr std::string_view TaskPriority = "task.priority";

  inline constexpr std::string_view ProjectId = "project.id";
  inline constexpr std::string_view ProjectName = "project.name";

  inline constexpr std::string_view UserId = "user.id";
  inline constexpr std::string_view UserName = "user.name";

  inline constexpr std::string_view ActionListId = "action_list.id";
  inline constexpr std::string_view ActionListName = "action_list.name";

  inline constexpr std::string_view HttpMethod = "http.method";
  inline constexpr std::string_view HttpUrl = "http.url";
  inline constexpr std::string_view HttpStatusCode = "http.status_code";

  inline constexpr std::string_view DbOperation = "db.operation";
  inline constexpr std::string_view DbName = "db.name";
  inline constexpr std::string_view DbStatement = "db.statement";

  inline constexpr std::string_view CacheHit = "cache.hit";
  inline constexpr std::string_view CacheKey = "cache.key";

  inline constexpr std::string_view RequestId = "request.id";
  inline constexpr std::string_view ToolName = "tool.name";
}

#endif
