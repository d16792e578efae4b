#include "toolwire/tools/command.hpp"

namespace toolwire::tools
{

CommandOutcome FunctionCommand::execute(const Json& arguments, const CancellationToken&) const
{
    if (!fn_)
        return ExecutionError{"no function bound"};
    try
    {
        return to_content(fn_(arguments));
    }
    catch (const std::exception& e)
    {
        return ExecutionError{e.what()};
    }
}

std::vector<ContentBlock> FunctionCommand::to_content(const Json& output)
{
    if (output.is_null())
        return {};
    if (output.is_string())
        return {make_text(output.get<std::string>())};
    if (output.is_object() && output.contains("content") && output["content"].is_array())
        return content_from_json(output["content"]);
    return {make_text(output.dump())};
}

} // namespace toolwire::tools
