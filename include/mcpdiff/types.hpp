#pragma once
#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace mcpdiff
{

using Json = nlohmann::json;

/// Tool descriptor as reported by tools/list
struct ToolInfo
{
    std::string name;
    Json inputSchema = Json::object();
};

// nlohmann::json adapters
inline void to_json(Json& j, const ToolInfo& t)
{
    j = Json{{"name", t.name}, {"inputSchema", t.inputSchema}};
}

inline void from_json(const Json& j, ToolInfo& t)
{
    t.name = j.at("name").get<std::string>();
    t.inputSchema = j.value("inputSchema", Json::object());
}

/// How to launch one server under test
struct ServerCommand
{
    std::string executable;
    std::vector<std::string> args;
    std::string working_directory;
    std::map<std::string, std::string> environment;
};

} // namespace mcpdiff
