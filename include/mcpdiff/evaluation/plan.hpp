#pragma once
/// @file evaluation/plan.hpp
/// @brief The fixed list of read-only calls issued to every server

#include "mcpdiff/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mcpdiff::evaluation
{

struct PlannedCall
{
    std::string tool;
    Json arguments = Json::object();
};

/// How a sample resource name is found when none is supplied
struct DiscoveryStep
{
    std::string tool{"list_repositories"};
    Json arguments = Json::object({{"limit", 1}});
    /// Array field of the structured result holding the candidates
    std::string collection{"repositories"};
    /// Field of the first candidate used as the resource name
    std::string field{"name"};
};

struct TestPlan
{
    /// Run unconditionally
    std::vector<PlannedCall> calls;
    /// Run only once a sample resource is known
    std::vector<PlannedCall> repo_calls;
    DiscoveryStep discovery;
    /// Argument name the sample resource is passed under
    std::string repo_argument{"repo_slug"};

    /// Read-only Bitbucket plan: no create, delete, merge or trigger operations
    static TestPlan builtin();

    /// Overlay `j` on the built-in plan; absent keys keep the built-in values.
    /// @throws ConfigError on malformed input
    static TestPlan from_json(const Json& j);

    /// @throws ConfigError if the file cannot be read or parsed
    static TestPlan load(const std::filesystem::path& path);

    /// Arguments for a repo-scoped call: the resource first, plan arguments over it
    Json scoped_arguments(const PlannedCall& call, const std::string& resource) const;
};

} // namespace mcpdiff::evaluation
