#pragma once
#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>

namespace toolwire
{

using Json = nlohmann::json;

/// JSON-RPC envelope tag carried by every message.
inline constexpr const char* JSONRPC_VERSION = "2.0";

/// MCP protocol revision this implementation speaks natively.
inline constexpr const char* PROTOCOL_VERSION = "2025-11-25";

/// Revisions accepted during initialize negotiation, newest first.
inline constexpr std::array<const char*, 4> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-11-25", "2025-06-18", "2025-03-26", "2024-11-05"};

inline bool is_supported_protocol_version(const std::string& version)
{
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS)
        if (version == v)
            return true;
    return false;
}

/// String member of a peer-supplied object; `fallback` when absent or not a string
inline std::string string_or(const Json& j, const char* key, const std::string& fallback = {})
{
    if (!j.is_object())
        return fallback;
    auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : fallback;
}

/// Name/version pair exchanged as clientInfo / serverInfo.
struct Implementation
{
    std::string name;
    std::string version;
};

inline void to_json(Json& j, const Implementation& impl)
{
    j = Json{{"name", impl.name}, {"version", impl.version}};
}

inline void from_json(const Json& j, Implementation& impl)
{
    impl.name = string_or(j, "name");
    impl.version = string_or(j, "version");
}

} // namespace toolwire
