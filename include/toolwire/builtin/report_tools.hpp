#pragma once
#include "toolwire/tools/registry.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace toolwire::builtin
{

/// In-memory file store shared by file_read and file_write.
class Workspace
{
  public:
    void write(const std::string& path, const std::string& content);
    std::optional<std::string> read(const std::string& path) const;
    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
};

/// Installs the research/report tool set (web_search, file_read,
/// file_write, analyze_data, fact_check). All tools are offline and
/// deterministic.
/// @return the workspace backing the file tools
std::shared_ptr<Workspace> register_report_tools(tools::ToolRegistry& registry);

} // namespace toolwire::builtin
