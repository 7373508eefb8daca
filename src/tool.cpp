#include "tool.hpp"
#include "plugin.hpp"

namespace engram {

std::vector<std::unique_ptr<Tool>> create_memory_tools(MemoryManager* manager) {
    auto tools = PluginRegistry::instance().create_all_tools();
    for (auto& tool : tools) {
        if (auto* aware = dynamic_cast<MemoryAwareTool*>(tool.get())) {
            aware->set_manager(manager);
        }
    }
    return tools;
}

} // namespace engram
