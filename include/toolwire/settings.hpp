#pragma once
#include "toolwire/types.hpp"

#include <string>

namespace toolwire
{

struct Settings
{
    std::string log_level{"INFO"};
    int request_timeout_ms{30000};
    int shutdown_grace_ms{5000};
    int tool_timeout_ms{0};
    int max_tool_rounds{5};
    int tools_page_size{0};

    /// Reads TOOLWIRE_* variables; unset or unparsable values keep defaults.
    static Settings from_env();
    static Settings from_json(const Json& j);

    Json to_json() const;

    /// Push log_level into the process-wide logger threshold.
    void apply_logging() const;
};

} // namespace toolwire
