#include "toolwire/content.hpp"

#include "toolwire/exceptions.hpp"

namespace toolwire
{

namespace
{
std::optional<std::string> optional_string(const Json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}
} // namespace

const char* content_type(const ContentBlock& block)
{
    if (std::holds_alternative<ImageContent>(block))
        return "image";
    if (std::holds_alternative<EmbeddedResource>(block))
        return "resource";
    return "text";
}

void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", "text"}, {"text", c.text}};
    if (c.annotations)
        j["annotations"] = *c.annotations;
}

void to_json(Json& j, const ImageContent& c)
{
    j = Json{{"type", "image"}, {"data", c.data}, {"mimeType", c.mime_type}};
    if (c.annotations)
        j["annotations"] = *c.annotations;
}

void to_json(Json& j, const EmbeddedResource& c)
{
    Json resource = {{"uri", c.uri}};
    if (c.text)
        resource["text"] = *c.text;
    if (c.blob)
        resource["blob"] = *c.blob;
    if (c.mime_type)
        resource["mimeType"] = *c.mime_type;
    j = Json{{"type", "resource"}, {"resource", resource}};
}

void to_json(Json& j, const ContentBlock& block)
{
    std::visit([&j](const auto& c) { to_json(j, c); }, block);
}

void from_json(const Json& j, TextContent& c)
{
    c.text = j.at("text").get<std::string>();
    if (j.contains("annotations"))
        c.annotations = j["annotations"];
}

void from_json(const Json& j, ImageContent& c)
{
    c.data = j.at("data").get<std::string>();
    c.mime_type = string_or(j, "mimeType");
    if (j.contains("annotations"))
        c.annotations = j["annotations"];
}

void from_json(const Json& j, EmbeddedResource& c)
{
    const Json& r = j.contains("resource") ? j.at("resource") : j;
    c.uri = r.at("uri").get<std::string>();
    c.text = optional_string(r, "text");
    c.blob = optional_string(r, "blob");
    c.mime_type = optional_string(r, "mimeType");
}

ContentBlock parse_content_block(const Json& j)
{
    if (j.is_object())
    {
        std::string type = string_or(j, "type");
        if (type == "text" && j.contains("text") && j["text"].is_string())
            return j.get<TextContent>();
        if (type == "image" && j.contains("data") && j["data"].is_string())
            return j.get<ImageContent>();
        if (type == "resource" && j.contains("resource") && j["resource"].is_object() &&
            j["resource"].contains("uri") && j["resource"]["uri"].is_string())
            return j.get<EmbeddedResource>();
    }
    // Keep what we could not interpret rather than dropping it
    return TextContent{j.dump(), std::nullopt};
}

Json content_to_json(const std::vector<ContentBlock>& blocks)
{
    Json arr = Json::array();
    for (const auto& block : blocks)
        arr.push_back(Json(block));
    return arr;
}

std::vector<ContentBlock> content_from_json(const Json& array)
{
    if (!array.is_array())
        throw ValidationError("content must be an array");
    std::vector<ContentBlock> blocks;
    blocks.reserve(array.size());
    for (const auto& item : array)
        blocks.push_back(parse_content_block(item));
    return blocks;
}

std::string flatten_text(const std::vector<ContentBlock>& blocks)
{
    std::string out;
    bool first = true;
    auto append = [&](const std::string& s)
    {
        if (!first)
            out += "\n";
        out += s;
        first = false;
    };
    for (const auto& block : blocks)
    {
        if (const auto* text = std::get_if<TextContent>(&block))
            append(text->text);
        else if (const auto* res = std::get_if<EmbeddedResource>(&block))
        {
            if (res->text)
                append(*res->text);
        }
    }
    return out;
}

} // namespace toolwire
