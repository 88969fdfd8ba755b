#include "mcpdiff/evaluation/plan.hpp"

#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/util/json.hpp"

#include <fstream>
#include <sstream>

namespace mcpdiff::evaluation
{

namespace
{

std::vector<PlannedCall> parse_calls(const Json& arr, const char* where)
{
    if (!arr.is_array())
        throw ConfigError(std::string("plan: '") + where + "' must be an array");

    std::vector<PlannedCall> calls;
    for (const auto& entry : arr)
    {
        if (!entry.is_object() || !entry.contains("tool") || !entry["tool"].is_string())
            throw ConfigError(std::string("plan: every entry of '") + where +
                              "' needs a string 'tool': " + entry.dump());
        PlannedCall call;
        call.tool = entry["tool"].get<std::string>();
        call.arguments = entry.value("arguments", Json::object());
        if (!call.arguments.is_object())
            throw ConfigError("plan: arguments of '" + call.tool + "' must be an object");
        calls.push_back(std::move(call));
    }
    return calls;
}

} // namespace

TestPlan TestPlan::builtin()
{
    TestPlan plan;
    plan.calls = {
        {"list_projects", Json::object()},
        {"list_repositories", Json{{"limit", 3}}},
    };
    plan.repo_calls = {
        {"list_branches", Json{{"limit", 5}}},
        {"list_pull_requests", Json{{"state", "OPEN"}, {"limit", 3}}},
        {"list_pipelines", Json{{"limit", 3}}},
        {"list_commits", Json{{"limit", 5}}},
        {"list_tags", Json{{"limit", 5}}},
        {"list_webhooks", Json{{"limit", 5}}},
        {"list_environments", Json{{"limit", 5}}},
    };
    return plan;
}

TestPlan TestPlan::from_json(const Json& j)
{
    if (!j.is_object())
        throw ConfigError("plan: top level must be an object");

    TestPlan plan = builtin();
    try
    {
        if (j.contains("calls"))
            plan.calls = parse_calls(j["calls"], "calls");
        if (j.contains("repo_calls"))
            plan.repo_calls = parse_calls(j["repo_calls"], "repo_calls");
        if (j.contains("repo_argument"))
            plan.repo_argument = j.at("repo_argument").get<std::string>();
        if (j.contains("discovery"))
        {
            const auto& d = j.at("discovery");
            if (!d.is_object())
                throw ConfigError("plan: 'discovery' must be an object");
            if (d.contains("tool"))
                plan.discovery.tool = d.at("tool").get<std::string>();
            if (d.contains("arguments"))
                plan.discovery.arguments = d.at("arguments");
            if (d.contains("collection"))
                plan.discovery.collection = d.at("collection").get<std::string>();
            if (d.contains("field"))
                plan.discovery.field = d.at("field").get<std::string>();
        }
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("plan: ") + e.what());
    }
    return plan;
}

TestPlan TestPlan::load(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open plan file " + path.string());
    std::stringstream ss;
    ss << in.rdbuf();
    auto parsed = util::json::try_parse(ss.str());
    if (!parsed)
        throw ConfigError("plan file " + path.string() + " is not valid JSON");
    return from_json(*parsed);
}

Json TestPlan::scoped_arguments(const PlannedCall& call, const std::string& resource) const
{
    Json args = {{repo_argument, resource}};
    for (auto it = call.arguments.begin(); it != call.arguments.end(); ++it)
        args[it.key()] = it.value();
    return args;
}

} // namespace mcpdiff::evaluation
