#include "toolwire/builtin/report_tools.hpp"

#include "toolwire/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <vector>

namespace toolwire::builtin
{

namespace
{

using tools::CancellationToken;
using tools::CommandOutcome;
using tools::ExecutionError;
using tools::ToolDefinition;

const util::log::Logger& logger()
{
    static const util::log::Logger instance("toolwire.builtin");
    return instance;
}

Json string_prop(const std::string& description)
{
    return Json{{"type", "string"}, {"description", description}};
}

std::vector<std::string> words_of(const std::string& text)
{
    std::vector<std::string> words;
    std::string current;
    for (char ch : text)
    {
        if (std::isalnum(static_cast<unsigned char>(ch)))
        {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        else if (!current.empty())
        {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        words.push_back(std::move(current));
    return words;
}

class WebSearchCommand : public tools::ToolCommand
{
  public:
    static ToolDefinition definition()
    {
        ToolDefinition def;
        def.name = "web_search";
        def.description =
            "Search the web for information on a given query. Returns relevant search results.";
        def.input_schema = {
            {"type", "object"},
            {"properties",
             {{"query", string_prop("The search query to look up")},
              {"max_results",
               {{"type", "integer"},
                {"description", "Maximum number of results to return"},
                {"default", 5}}}}},
            {"required", Json::array({"query"})}};
        tools::ToolAnnotations hints;
        hints.read_only_hint = true;
        hints.open_world_hint = true;
        def.annotations = hints;
        return def;
    }

    CommandOutcome execute(const Json& arguments, const CancellationToken&) const override
    {
        static const char* findings[] = {
            "Recent developments show significant progress in this area",
            "Multiple sources confirm growing interest and adoption",
            "Expert opinions highlight both opportunities and challenges",
            "Latest research indicates promising future directions",
            "Industry reports suggest continued growth and innovation",
        };
        std::string query = arguments.at("query").get<std::string>();
        int max_results = arguments.value("max_results", 5);
        if (max_results < 1)
            return ExecutionError{"max_results must be at least 1"};
        int count = std::min(max_results, 5);

        logger().debug("web_search '" + query + "' max_results=" + std::to_string(max_results));
        std::ostringstream out;
        out << "Web search results for '" << query << "':\n\n";
        for (int i = 0; i < count; ++i)
            out << (i + 1) << ". " << findings[i] << "\n";
        out << "\nNote: offline search index; results are illustrative.";
        return std::vector<ContentBlock>{make_text(out.str())};
    }
};

class FileReadCommand : public tools::ToolCommand
{
  public:
    explicit FileReadCommand(std::shared_ptr<Workspace> workspace)
        : workspace_(std::move(workspace))
    {
    }

    static ToolDefinition definition()
    {
        ToolDefinition def;
        def.name = "file_read";
        def.description = "Read contents from a file in the workspace";
        def.input_schema = {{"type", "object"},
                            {"properties", {{"file_path", string_prop("Path to the file to read")}}},
                            {"required", Json::array({"file_path"})}};
        tools::ToolAnnotations hints;
        hints.read_only_hint = true;
        def.annotations = hints;
        return def;
    }

    CommandOutcome execute(const Json& arguments, const CancellationToken&) const override
    {
        std::string path = arguments.at("file_path").get<std::string>();
        auto content = workspace_->read(path);
        if (!content)
            return ExecutionError{"file not found in workspace: " + path};
        return std::vector<ContentBlock>{make_text(*content)};
    }

  private:
    std::shared_ptr<Workspace> workspace_;
};

class FileWriteCommand : public tools::ToolCommand
{
  public:
    explicit FileWriteCommand(std::shared_ptr<Workspace> workspace)
        : workspace_(std::move(workspace))
    {
    }

    static ToolDefinition definition()
    {
        ToolDefinition def;
        def.name = "file_write";
        def.description = "Write or update content to a file in the workspace";
        def.input_schema = {
            {"type", "object"},
            {"properties",
             {{"file_path", string_prop("Path to the file to write")},
              {"content", string_prop("Content to write to the file")}}},
            {"required", Json::array({"file_path", "content"})}};
        tools::ToolAnnotations hints;
        hints.destructive_hint = true;
        hints.idempotent_hint = true;
        def.annotations = hints;
        return def;
    }

    CommandOutcome execute(const Json& arguments, const CancellationToken&) const override
    {
        std::string path = arguments.at("file_path").get<std::string>();
        std::string content = arguments.at("content").get<std::string>();
        if (path.empty())
            return ExecutionError{"file_path must not be empty"};
        workspace_->write(path, content);
        return std::vector<ContentBlock>{make_text("Successfully wrote " +
                                                   std::to_string(content.size()) +
                                                   " characters to " + path)};
    }

  private:
    std::shared_ptr<Workspace> workspace_;
};

class AnalyzeDataCommand : public tools::ToolCommand
{
  public:
    static ToolDefinition definition()
    {
        ToolDefinition def;
        def.name = "analyze_data";
        def.description = "Analyze data and extract insights, patterns, or statistics";
        def.input_schema = {
            {"type", "object"},
            {"properties",
             {{"data", string_prop("The data to analyze (text, JSON, or structured format)")},
              {"analysis_type",
               {{"type", "string"},
                {"description", "Type of analysis to perform"},
                {"enum", Json::array({"summary", "patterns", "statistics", "sentiment"})},
                {"default", "summary"}}}}},
            {"required", Json::array({"data"})}};
        tools::ToolAnnotations hints;
        hints.read_only_hint = true;
        def.annotations = hints;
        return def;
    }

    CommandOutcome execute(const Json& arguments, const CancellationToken&) const override
    {
        std::string data = arguments.at("data").get<std::string>();
        std::string type = arguments.value("analysis_type", "summary");
        auto words = words_of(data);

        std::ostringstream out;
        out << "Data Analysis (" << type << "):\n\n";
        out << "- Data size: " << data.size() << " characters\n";
        out << "- Words: " << words.size() << "\n";

        if (type == "statistics")
            statistics(data, out);
        else if (type == "patterns")
            patterns(words, out);
        else if (type == "sentiment")
            sentiment(words, out);
        else
            out << "- Lines: " << (std::count(data.begin(), data.end(), '\n') + 1) << "\n";
        return std::vector<ContentBlock>{make_text(out.str())};
    }

  private:
    static void statistics(const std::string& data, std::ostringstream& out)
    {
        std::vector<double> numbers;
        std::istringstream in(data);
        std::string token;
        while (in >> token)
        {
            token.erase(std::remove(token.begin(), token.end(), ','), token.end());
            char* end = nullptr;
            double v = std::strtod(token.c_str(), &end);
            if (!token.empty() && end && *end == '\0')
                numbers.push_back(v);
        }
        out << "- Numeric values: " << numbers.size() << "\n";
        if (numbers.empty())
            return;
        double sum = 0;
        for (double v : numbers)
            sum += v;
        auto [lo, hi] = std::minmax_element(numbers.begin(), numbers.end());
        out << std::fixed << std::setprecision(2);
        out << "- Min: " << *lo << "\n- Max: " << *hi << "\n- Mean: " << sum / numbers.size()
            << "\n";
    }

    static void patterns(const std::vector<std::string>& words, std::ostringstream& out)
    {
        std::map<std::string, int> freq;
        for (const auto& w : words)
            if (w.size() > 3)
                ++freq[w];
        std::vector<std::pair<std::string, int>> ranked(freq.begin(), freq.end());
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        out << "- Recurring terms:";
        if (ranked.empty() || ranked.front().second < 2)
        {
            out << " none\n";
            return;
        }
        for (size_t i = 0; i < ranked.size() && i < 5 && ranked[i].second > 1; ++i)
            out << " " << ranked[i].first << " (" << ranked[i].second << ")";
        out << "\n";
    }

    static void sentiment(const std::vector<std::string>& words, std::ostringstream& out)
    {
        static const std::set<std::string> positive = {"good",     "great",    "excellent",
                                                       "positive", "growth",   "success",
                                                       "improve",  "improved", "promising"};
        static const std::set<std::string> negative = {"bad",     "poor",     "negative",
                                                       "decline", "failure",  "risk",
                                                       "worse",   "problem",  "concern"};
        int pos = 0;
        int neg = 0;
        for (const auto& w : words)
        {
            pos += positive.count(w) ? 1 : 0;
            neg += negative.count(w) ? 1 : 0;
        }
        const char* label = pos > neg ? "positive" : (neg > pos ? "negative" : "neutral");
        out << "- Positive terms: " << pos << "\n- Negative terms: " << neg
            << "\n- Overall: " << label << "\n";
    }
};

class FactCheckCommand : public tools::ToolCommand
{
  public:
    static ToolDefinition definition()
    {
        ToolDefinition def;
        def.name = "fact_check";
        def.description = "Verify facts and claims against available sources";
        def.input_schema = {
            {"type", "object"},
            {"properties",
             {{"claim", string_prop("The claim or statement to verify")},
              {"sources", string_prop("Sources to check against (optional)")}}},
            {"required", Json::array({"claim"})}};
        tools::ToolAnnotations hints;
        hints.read_only_hint = true;
        hints.open_world_hint = true;
        def.annotations = hints;
        return def;
    }

    CommandOutcome execute(const Json& arguments, const CancellationToken&) const override
    {
        std::string claim = arguments.at("claim").get<std::string>();
        std::string sources = arguments.value("sources", "");
        std::ostringstream out;
        out << "Fact Check Result:\n\n";
        out << "Claim: \"" << claim << "\"\n\n";
        out << "Status: UNVERIFIED (offline)\n";
        out << "Sources Checked: " << (sources.empty() ? "none available offline" : sources)
            << "\n";
        return std::vector<ContentBlock>{make_text(out.str())};
    }
};

} // namespace

void Workspace::write(const std::string& path, const std::string& content)
{
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = content;
}

std::optional<std::string> Workspace::read(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    if (it == files_.end())
        return std::nullopt;
    return it->second;
}

size_t Workspace::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

std::shared_ptr<Workspace> register_report_tools(tools::ToolRegistry& registry)
{
    auto workspace = std::make_shared<Workspace>();
    registry.register_tool(WebSearchCommand::definition(), std::make_shared<WebSearchCommand>());
    registry.register_tool(FileReadCommand::definition(),
                           std::make_shared<FileReadCommand>(workspace));
    registry.register_tool(FileWriteCommand::definition(),
                           std::make_shared<FileWriteCommand>(workspace));
    registry.register_tool(AnalyzeDataCommand::definition(),
                           std::make_shared<AnalyzeDataCommand>());
    registry.register_tool(FactCheckCommand::definition(), std::make_shared<FactCheckCommand>());
    return workspace;
}

} // namespace toolwire::builtin
