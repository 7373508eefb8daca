#include "plugin.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>

namespace engram {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_tool(const std::string& name, ToolFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[name] = std::move(factory);
}

void PluginRegistry::register_index(const std::string& name, IndexFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    indexes_[name] = std::move(factory);
}

std::unique_ptr<Tool> PluginRegistry::create_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw NotFoundError("Unknown tool: " + name);
    }
    return it->second();
}

std::vector<std::unique_ptr<Tool>> PluginRegistry::create_all_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::unique_ptr<Tool>> result;
    result.reserve(tools_.size());
    for (const auto& [name, factory] : tools_) {
        result.push_back(factory());
    }
    std::sort(result.begin(), result.end(),
              [](const std::unique_ptr<Tool>& a, const std::unique_ptr<Tool>& b) {
                  return a->tool_name() < b->tool_name();
              });
    return result;
}

std::unique_ptr<SimilarityIndex> PluginRegistry::create_index(const std::string& name,
                                                              const Config& config,
                                                              const std::string& collection) const {
    IndexFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = indexes_.find(name);
        if (it == indexes_.end()) {
            throw BackendUnavailableError("Unknown similarity index backend: " + name);
        }
        factory = it->second;
    }
    // Opening a backend touches the filesystem; keep the registry lock out of it
    return factory(config, collection);
}

std::vector<std::string> PluginRegistry::tool_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::index_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(indexes_.size());
    for (const auto& [name, _] : indexes_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

bool PluginRegistry::has_index(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indexes_.count(name) > 0;
}

} // namespace engram
