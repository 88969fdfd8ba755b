#include "mcpdiff/client/tool_client.hpp"

#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/util/json.hpp"

namespace mcpdiff::client
{

std::vector<ToolInfo> parse_list_tools_response(const Json& response, const std::string& label)
{
    if (response.contains("error"))
        throw ToolListError("[" + label + "] Error listing tools: " + response["error"].dump());

    std::vector<ToolInfo> tools;
    auto result_it = response.find("result");
    if (result_it == response.end() || !result_it->is_object())
        return tools;
    auto tools_it = result_it->find("tools");
    if (tools_it == result_it->end() || !tools_it->is_array())
        return tools;

    tools.reserve(tools_it->size());
    for (const auto& entry : *tools_it)
    {
        try
        {
            tools.push_back(entry.get<ToolInfo>());
        }
        catch (const Json::exception& e)
        {
            throw ProtocolError("[" + label + "] malformed tool descriptor " + entry.dump() + ": " +
                                e.what());
        }
    }
    return tools;
}

ToolResult parse_call_tool_response(const Json& response)
{
    if (!response.is_object())
        throw ProtocolError("tools/call response is not an object: " + response.dump());

    if (response.contains("error"))
        return ErrorResult{response["error"]};

    Json result = response.value("result", Json::object());
    if (!result.is_object())
        return StructuredResult{result};

    auto content_it = result.find("content");
    if (content_it == result.end() || !content_it->is_array() || content_it->empty())
        return StructuredResult{result};

    const Json& first = content_it->front();
    std::string text = "{}";
    if (first.is_object() && first.contains("text"))
    {
        const Json& t = first["text"];
        text = t.is_string() ? t.get<std::string>() : t.dump();
    }

    if (auto decoded = util::json::try_parse(text))
        return StructuredResult{std::move(*decoded)};
    return RawTextResult{std::move(text)};
}

std::vector<ToolInfo> ToolClient::list_tools()
{
    return parse_list_tools_response(session_.request("tools/list", Json::object()),
                                     session_.label());
}

ToolResult ToolClient::call_tool(const std::string& name, const Json& arguments)
{
    Json params = {{"name", name},
                   {"arguments", arguments.is_null() ? Json::object() : arguments}};
    return parse_call_tool_response(session_.request("tools/call", params));
}

} // namespace mcpdiff::client
