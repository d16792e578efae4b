#pragma once
#include "toolwire/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolwire
{

struct TextContent
{
    std::string text;
    std::optional<Json> annotations;
};

struct ImageContent
{
    std::string data;      // base64-encoded image bytes
    std::string mime_type; // e.g., "image/png"
    std::optional<Json> annotations;
};

/// Embedded resource; exactly one of text/blob is normally present.
struct EmbeddedResource
{
    std::string uri;
    std::optional<std::string> text;
    std::optional<std::string> blob; // base64
    std::optional<std::string> mime_type;
};

/// Tagged content block. The wire discriminator is the "type" field.
using ContentBlock = std::variant<TextContent, ImageContent, EmbeddedResource>;

/// Wire tag for a content block ("text", "image" or "resource").
const char* content_type(const ContentBlock& block);

inline ContentBlock make_text(std::string text)
{
    return TextContent{std::move(text), std::nullopt};
}

// nlohmann::json adapters
void to_json(Json& j, const TextContent& c);
void to_json(Json& j, const ImageContent& c);
void to_json(Json& j, const EmbeddedResource& c);
void to_json(Json& j, const ContentBlock& block);

void from_json(const Json& j, TextContent& c);
void from_json(const Json& j, ImageContent& c);
void from_json(const Json& j, EmbeddedResource& c);

/// Parse a content block from JSON. Unknown "type" values are preserved as a
/// text block holding the raw JSON so no received content is dropped.
ContentBlock parse_content_block(const Json& j);

Json content_to_json(const std::vector<ContentBlock>& blocks);
std::vector<ContentBlock> content_from_json(const Json& array);

/// Concatenate text blocks and embedded-resource text, joined with newlines.
std::string flatten_text(const std::vector<ContentBlock>& blocks);

} // namespace toolwire
