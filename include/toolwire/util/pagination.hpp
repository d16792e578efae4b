#pragma once
#include "toolwire/exceptions.hpp"
#include "toolwire/types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolwire::util::pagination
{

/// Position encoded in an opaque cursor
struct CursorState
{
    size_t offset{0};
};

namespace detail
{
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline int sextet(char ch)
{
    for (int i = 0; i < 64; ++i)
        if (kAlphabet[i] == ch)
            return i;
    return -1;
}
} // namespace detail

inline std::string base64_encode(const std::string& input)
{
    std::string out;
    uint32_t bits = 0;
    int nbits = 0;
    for (unsigned char byte : input)
    {
        bits = (bits << 8) | byte;
        nbits += 8;
        while (nbits >= 6)
        {
            nbits -= 6;
            out += detail::kAlphabet[(bits >> nbits) & 0x3F];
        }
    }
    if (nbits > 0)
        out += detail::kAlphabet[(bits << (6 - nbits)) & 0x3F];
    while (out.size() % 4 != 0)
        out += '=';
    return out;
}

/// @return std::nullopt when `input` is not padded base64
inline std::optional<std::string> base64_decode(const std::string& input)
{
    if (input.size() % 4 != 0)
        return std::nullopt;

    size_t body = input.find('=');
    if (body == std::string::npos)
        body = input.size();
    else if (input.size() - body > 2 || input.find_first_not_of('=', body) != std::string::npos)
        return std::nullopt;

    std::string out;
    uint32_t bits = 0;
    int nbits = 0;
    for (size_t i = 0; i < body; ++i)
    {
        int v = detail::sextet(input[i]);
        if (v < 0)
            return std::nullopt;
        bits = (bits << 6) | static_cast<uint32_t>(v);
        nbits += 6;
        if (nbits >= 8)
        {
            nbits -= 8;
            out += static_cast<char>((bits >> nbits) & 0xFF);
        }
    }
    return out;
}

inline std::string encode_cursor(size_t offset)
{
    Json j = {{"o", offset}};
    return base64_encode(j.dump());
}

/// @return std::nullopt for cursors this module did not produce
inline std::optional<CursorState> decode_cursor(const std::string& cursor)
{
    auto decoded = base64_decode(cursor);
    if (!decoded || decoded->empty())
        return std::nullopt;

    Json j = Json::parse(*decoded, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object() || !j.contains("o") || !j["o"].is_number_unsigned())
        return std::nullopt;
    return CursorState{j["o"].get<size_t>()};
}

template <typename T>
struct PaginatedResult
{
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

/// Slice `items` at the cursor position.
/// @param page_size items per page; <= 0 returns everything in one page
/// @throws ValidationError for an undecodable cursor
template <typename T>
PaginatedResult<T> paginate_sequence(const std::vector<T>& items,
                                     const std::optional<std::string>& cursor, int page_size)
{
    if (page_size <= 0)
        return {items, std::nullopt};

    size_t offset = 0;
    if (cursor.has_value() && !cursor->empty())
    {
        auto state = decode_cursor(*cursor);
        if (!state)
            throw ValidationError("Invalid cursor: " + *cursor);
        offset = state->offset;
    }

    if (offset >= items.size())
        return {{}, std::nullopt};

    size_t end = std::min(items.size(), offset + static_cast<size_t>(page_size));
    std::vector<T> page(items.begin() + static_cast<std::ptrdiff_t>(offset),
                        items.begin() + static_cast<std::ptrdiff_t>(end));
    std::optional<std::string> next;
    if (end < items.size())
        next = encode_cursor(end);

    return {std::move(page), std::move(next)};
}

} // namespace toolwire::util::pagination
