#pragma once
#include "toolwire/llm/conversation.hpp"
#include "toolwire/tools/tool.hpp"

#include <memory>
#include <string>

namespace toolwire::llm
{

/// Provider-specific function-calling format. The tool catalog stays
/// dialect-neutral; only these projections know vendor shapes.
class LlmDialect
{
  public:
    virtual ~LlmDialect() = default;

    virtual std::string name() const = 0;

    /// One tool definition in the provider's tool schema.
    virtual Json tool_spec(const tools::ToolDefinition& tool) const = 0;

    /// Request body fragment carrying the conversation and, when `tools` is a
    /// non-empty array, the tool list.
    virtual Json render_request(const Conversation& conversation, const Json& tools) const = 0;

    /// Extract text and tool requests from a provider response body.
    virtual Completion parse_completion(const Json& response) const = 0;
};

/// OpenAI chat-completions style:
/// {"type":"function","function":{name, description, parameters}}.
class OpenAiDialect : public LlmDialect
{
  public:
    std::string name() const override
    {
        return "openai";
    }
    Json tool_spec(const tools::ToolDefinition& tool) const override;
    Json render_request(const Conversation& conversation, const Json& tools) const override;
    Completion parse_completion(const Json& response) const override;
};

/// Anthropic messages style: {name, description, input_schema}; system
/// prompt lifted out of the message list, tool results sent as user blocks.
class AnthropicDialect : public LlmDialect
{
  public:
    std::string name() const override
    {
        return "anthropic";
    }
    Json tool_spec(const tools::ToolDefinition& tool) const override;
    Json render_request(const Conversation& conversation, const Json& tools) const override;
    Completion parse_completion(const Json& response) const override;
};

/// @throws NotFoundError for unknown dialect names
std::unique_ptr<LlmDialect> make_dialect(const std::string& name);

} // namespace toolwire::llm
