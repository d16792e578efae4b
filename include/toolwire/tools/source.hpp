#pragma once
#include "toolwire/tools/tool.hpp"

#include <vector>

namespace toolwire::tools
{

/// Anything that can enumerate and execute tools: a local registry or a
/// remote server reached through a client.
class ToolSource
{
  public:
    virtual ~ToolSource() = default;

    virtual std::vector<ToolDefinition> list_definitions() = 0;

    /// Must report tool failures through ToolResult::is_error.
    virtual ToolResult invoke(const ToolCall& call) = 0;
};

} // namespace toolwire::tools
