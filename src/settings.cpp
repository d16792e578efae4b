#include "toolwire/settings.hpp"

#include "toolwire/exceptions.hpp"
#include "toolwire/util/log.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace toolwire
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(v, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < 0 || parsed > INT_MAX)
    {
        util::log::Logger("toolwire.settings")
            .warning(std::string("ignoring invalid ") + key + "=" + v);
        return defv;
    }
    return static_cast<int>(parsed);
}

static int json_int(const Json& j, const char* key, int defv)
{
    auto it = j.find(key);
    if (it == j.end())
        return defv;
    if (!it->is_number_integer() || it->get<long long>() < 0 || it->get<long long>() > INT_MAX)
        throw ValidationError(std::string("setting '") + key + "' must be a non-negative integer");
    return it->get<int>();
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("TOOLWIRE_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.request_timeout_ms = getenv_int("TOOLWIRE_REQUEST_TIMEOUT_MS", s.request_timeout_ms);
    s.shutdown_grace_ms = getenv_int("TOOLWIRE_SHUTDOWN_GRACE_MS", s.shutdown_grace_ms);
    s.tool_timeout_ms = getenv_int("TOOLWIRE_TOOL_TIMEOUT_MS", s.tool_timeout_ms);
    s.max_tool_rounds = getenv_int("TOOLWIRE_MAX_TOOL_ROUNDS", s.max_tool_rounds);
    s.tools_page_size = getenv_int("TOOLWIRE_TOOLS_PAGE_SIZE", s.tools_page_size);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    if (!j.is_object())
        throw ValidationError("settings must be a JSON object");
    Settings s;
    if (j.contains("log_level"))
    {
        if (!j["log_level"].is_string())
            throw ValidationError("setting 'log_level' must be a string");
        s.log_level = j["log_level"].get<std::string>();
        std::transform(s.log_level.begin(), s.log_level.end(), s.log_level.begin(), ::toupper);
    }
    s.request_timeout_ms = json_int(j, "request_timeout_ms", s.request_timeout_ms);
    s.shutdown_grace_ms = json_int(j, "shutdown_grace_ms", s.shutdown_grace_ms);
    s.tool_timeout_ms = json_int(j, "tool_timeout_ms", s.tool_timeout_ms);
    s.max_tool_rounds = json_int(j, "max_tool_rounds", s.max_tool_rounds);
    s.tools_page_size = json_int(j, "tools_page_size", s.tools_page_size);
    return s;
}

Json Settings::to_json() const
{
    return Json{{"log_level", log_level},
                {"request_timeout_ms", request_timeout_ms},
                {"shutdown_grace_ms", shutdown_grace_ms},
                {"tool_timeout_ms", tool_timeout_ms},
                {"max_tool_rounds", max_tool_rounds},
                {"tools_page_size", tools_page_size}};
}

void Settings::apply_logging() const
{
    util::log::set_level(util::log::level_from_string(log_level));
}

} // namespace toolwire
