#include "mcpdiff/settings.hpp"

#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/version.hpp"

#include <algorithm>
#include <cstdlib>

namespace mcpdiff
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::chrono::milliseconds getenv_ms(const char* key, std::chrono::milliseconds defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        size_t pos = 0;
        long long ms = std::stoll(v, &pos, 10);
        if (pos != std::string(v).size() || ms <= 0)
            return defv;
        return std::chrono::milliseconds(ms);
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

Settings::Settings() : client_version(VERSION_STRING) {}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPDIFF_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.read_timeout = getenv_ms("MCPDIFF_READ_TIMEOUT_MS", s.read_timeout);
    s.stop_grace = getenv_ms("MCPDIFF_STOP_GRACE_MS", s.stop_grace);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    try
    {
        if (j.contains("log_level"))
            s.log_level = j.at("log_level").get<std::string>();
        if (j.contains("read_timeout_ms"))
            s.read_timeout = std::chrono::milliseconds(j.at("read_timeout_ms").get<long long>());
        if (j.contains("stop_grace_ms"))
            s.stop_grace = std::chrono::milliseconds(j.at("stop_grace_ms").get<long long>());
        if (j.contains("protocol_version"))
            s.protocol_version = j.at("protocol_version").get<std::string>();
        if (j.contains("client_name"))
            s.client_name = j.at("client_name").get<std::string>();
        if (j.contains("client_version"))
            s.client_version = j.at("client_version").get<std::string>();
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("invalid settings: ") + e.what());
    }
    return s;
}

Credentials Credentials::from_env()
{
    Credentials c;
    c.workspace = getenv_str(WORKSPACE_VAR, "");
    c.email = getenv_str(EMAIL_VAR, "");
    c.api_token = getenv_str(TOKEN_VAR, "");
    return c;
}

std::vector<std::string> Credentials::missing() const
{
    std::vector<std::string> out;
    if (workspace.empty())
        out.emplace_back(WORKSPACE_VAR);
    if (email.empty())
        out.emplace_back(EMAIL_VAR);
    if (api_token.empty())
        out.emplace_back(TOKEN_VAR);
    return out;
}

std::map<std::string, std::string> Credentials::to_environment() const
{
    return {{WORKSPACE_VAR, workspace}, {EMAIL_VAR, email}, {TOKEN_VAR, api_token}};
}

} // namespace mcpdiff
