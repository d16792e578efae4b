#pragma once
#include "toolwire/exceptions.hpp"
#include "toolwire/types.hpp"

namespace toolwire::util::schema
{

// Minimal JSON Schema subset used for tool arguments:
// - type: object, array, string, number, integer, boolean, null (or a list)
// - required: [..]
// - properties: { name: <schema> } (checked recursively)
// - enum: [..]
// - items: <schema>

/// @throws ValidationError naming the first offending location
void validate(const Json& schema, const Json& instance);

/// True when `schema` is an object schema usable as a tool input schema.
bool is_object_schema(const Json& schema);

} // namespace toolwire::util::schema
