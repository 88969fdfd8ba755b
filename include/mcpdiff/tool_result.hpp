#pragma once
/// @file tool_result.hpp
/// @brief Outcome of one tools/call, as one of three explicit shapes

#include "mcpdiff/types.hpp"

#include <string>
#include <variant>

namespace mcpdiff
{

/// First text block decoded as JSON (or the bare result when there was no content)
struct StructuredResult
{
    Json value;
};

/// First text block that did not decode as JSON
struct RawTextResult
{
    std::string text;
};

/// The response carried a JSON-RPC `error`; kept verbatim
struct ErrorResult
{
    Json error;
};

using ToolResult = std::variant<StructuredResult, RawTextResult, ErrorResult>;

inline bool is_error(const ToolResult& r)
{
    return std::holds_alternative<ErrorResult>(r);
}

/// True for an ErrorResult, and for a structured object that itself carries an
/// `error` key (servers that report failures inside the text payload).
inline bool carries_error(const ToolResult& r)
{
    if (is_error(r))
        return true;
    if (auto* s = std::get_if<StructuredResult>(&r))
        return s->value.is_object() && s->value.contains("error");
    return false;
}

inline const char* kind_name(const ToolResult& r)
{
    switch (r.index())
    {
    case 0:
        return "structured";
    case 1:
        return "raw";
    default:
        return "error";
    }
}

/// Mapping view: the structured value, {"raw": text} or {"error": error}
inline Json as_json(const ToolResult& r)
{
    if (auto* s = std::get_if<StructuredResult>(&r))
        return s->value;
    if (auto* raw = std::get_if<RawTextResult>(&r))
        return Json{{"raw", raw->text}};
    return Json{{"error", std::get<ErrorResult>(r).error}};
}

} // namespace mcpdiff
