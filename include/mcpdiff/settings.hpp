#pragma once
#include "mcpdiff/types.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace mcpdiff
{

struct Settings
{
    std::string log_level{"INFO"};
    /// Upper bound on any single wait for a response line
    std::chrono::milliseconds read_timeout{30000};
    /// How long stop() waits after SIGTERM before escalating to SIGKILL
    std::chrono::milliseconds stop_grace{5000};
    std::string protocol_version{"2024-11-05"};
    std::string client_name{"mcpdiff"};
    std::string client_version;

    Settings();

    static Settings from_env();
    static Settings from_json(const Json& j);
};

/// Bitbucket credentials both servers need in their environment
struct Credentials
{
    static constexpr const char* WORKSPACE_VAR = "BITBUCKET_WORKSPACE";
    static constexpr const char* EMAIL_VAR = "BITBUCKET_EMAIL";
    static constexpr const char* TOKEN_VAR = "BITBUCKET_API_TOKEN";

    std::string workspace;
    std::string email;
    std::string api_token;

    static Credentials from_env();

    /// Names of the variables that are unset or empty, in declaration order
    std::vector<std::string> missing() const;

    std::map<std::string, std::string> to_environment() const;
};

} // namespace mcpdiff
