#pragma once
/// @file client/tool_client.hpp
/// @brief tools/list and tools/call on top of a ready Session

#include "mcpdiff/client/session.hpp"
#include "mcpdiff/tool_result.hpp"
#include "mcpdiff/types.hpp"

#include <string>
#include <vector>

namespace mcpdiff::client
{

/// Decode a tools/list response message.
/// @throws ToolListError if it carries `error`, ProtocolError if an entry has no name
std::vector<ToolInfo> parse_list_tools_response(const Json& response, const std::string& label);

/// Unwrap a tools/call response message into a ToolResult.
/// A remote `error` is data (ErrorResult), never an exception.
ToolResult parse_call_tool_response(const Json& response);

class ToolClient
{
  public:
    explicit ToolClient(Session& session) : session_(session) {}

    std::vector<ToolInfo> list_tools();

    ToolResult call_tool(const std::string& name, const Json& arguments);

    Session& session()
    {
        return session_;
    }

  private:
    Session& session_;
};

} // namespace mcpdiff::client
