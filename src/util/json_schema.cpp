#include "toolwire/util/json_schema.hpp"

#include <string>

namespace toolwire::util::schema
{

namespace
{

bool is_type(const Json& inst, const std::string& type)
{
    if (type == "object")
        return inst.is_object();
    if (type == "array")
        return inst.is_array();
    if (type == "string")
        return inst.is_string();
    if (type == "number")
        return inst.is_number();
    if (type == "integer")
        return inst.is_number_integer();
    if (type == "boolean")
        return inst.is_boolean();
    if (type == "null")
        return inst.is_null();
    return true; // unknown treated as pass-through
}

std::string where(const std::string& path)
{
    return path.empty() ? "root" : path;
}

void validate_at(const Json& schema, const Json& inst, const std::string& path)
{
    if (!schema.is_object())
        return;

    if (schema.contains("type"))
    {
        const Json& t = schema["type"];
        bool ok = true;
        std::string expected;
        if (t.is_string())
        {
            expected = t.get<std::string>();
            ok = is_type(inst, expected);
        }
        else if (t.is_array())
        {
            ok = false;
            for (const auto& alt : t)
            {
                if (!alt.is_string())
                    continue;
                if (!expected.empty())
                    expected += "|";
                expected += alt.get<std::string>();
                ok = ok || is_type(inst, alt.get<std::string>());
            }
        }
        if (!ok)
            throw ValidationError("type mismatch for " + where(path) + ": expected " + expected);
    }

    if (schema.contains("enum") && schema["enum"].is_array())
    {
        bool found = false;
        for (const auto& v : schema["enum"])
            found = found || v == inst;
        if (!found)
            throw ValidationError("value for " + where(path) + " is not one of " +
                                  schema["enum"].dump());
    }

    if (inst.is_object())
    {
        if (schema.contains("required") && schema["required"].is_array())
        {
            for (const auto& req : schema["required"])
            {
                if (!req.is_string())
                    continue;
                auto key = req.get<std::string>();
                if (!inst.contains(key))
                    throw ValidationError("missing required: " +
                                          (path.empty() ? key : path + "." + key));
            }
        }
        if (schema.contains("properties") && schema["properties"].is_object())
        {
            for (auto& [name, subschema] : schema["properties"].items())
            {
                if (inst.contains(name))
                    validate_at(subschema, inst[name], path.empty() ? name : path + "." + name);
            }
        }
    }

    if (inst.is_array() && schema.contains("items") && schema["items"].is_object())
    {
        for (size_t i = 0; i < inst.size(); ++i)
            validate_at(schema["items"], inst[i], path + "[" + std::to_string(i) + "]");
    }
}

} // namespace

void validate(const Json& schema, const Json& instance)
{
    validate_at(schema, instance, "");
}

bool is_object_schema(const Json& schema)
{
    if (!schema.is_object())
        return false;
    auto t = schema.find("type");
    return t == schema.end() || (t->is_string() && t->get<std::string>() == "object");
}

} // namespace toolwire::util::schema
