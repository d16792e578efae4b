/// @file content.cpp
/// @brief Content block wire format

#include "toolwire/content.hpp"
#include "toolwire/exceptions.hpp"

#include <cassert>
#include <iostream>

using namespace toolwire;

void test_text_block_wire_shape()
{
    std::cout << "  test_text_block_wire_shape... " << std::flush;
    Json j = ContentBlock(make_text("hello"));
    assert(j["type"] == "text");
    assert(j["text"] == "hello");
    assert(!j.contains("annotations"));
    std::cout << "PASSED\n";
}

void test_image_and_resource_blocks()
{
    std::cout << "  test_image_and_resource_blocks... " << std::flush;
    ImageContent img{"aGVsbG8=", "image/png", std::nullopt};
    Json ij = ContentBlock(img);
    assert(ij["type"] == "image");
    assert(ij["mimeType"] == "image/png");

    EmbeddedResource res{"file:///notes.txt", std::string("notes"), std::nullopt,
                         std::string("text/plain")};
    Json rj = ContentBlock(res);
    assert(rj["type"] == "resource");
    assert(rj["resource"]["uri"] == "file:///notes.txt");
    assert(rj["resource"]["text"] == "notes");
    assert(!rj["resource"].contains("blob"));

    auto parsed = parse_content_block(rj);
    assert(std::string(content_type(parsed)) == "resource");
    auto* back = std::get_if<EmbeddedResource>(&parsed);
    assert(back && back->mime_type == std::optional<std::string>("text/plain"));
    std::cout << "PASSED\n";
}

void test_unknown_type_kept_as_text()
{
    std::cout << "  test_unknown_type_kept_as_text... " << std::flush;
    Json audio = {{"type", "audio"}, {"data", "AAAA"}};
    auto block = parse_content_block(audio);
    auto* text = std::get_if<TextContent>(&block);
    assert(text);
    assert(Json::parse(text->text) == audio);
    std::cout << "PASSED\n";
}

void test_content_array_helpers()
{
    std::cout << "  test_content_array_helpers... " << std::flush;
    std::vector<ContentBlock> blocks = {make_text("a"), ImageContent{"x", "image/png", {}},
                                        EmbeddedResource{"u", std::string("b"), {}, {}}};
    Json arr = content_to_json(blocks);
    assert(arr.is_array() && arr.size() == 3);
    auto back = content_from_json(arr);
    assert(back.size() == 3);
    assert(flatten_text(back) == "a\nb");

    bool threw = false;
    try
    {
        content_from_json(Json{{"type", "text"}});
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Content tests\n";
    test_text_block_wire_shape();
    test_image_and_resource_blocks();
    test_unknown_type_kept_as_text();
    test_content_array_helpers();
    std::cout << "All content tests passed\n";
    return 0;
}
