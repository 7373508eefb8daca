#include "similarity_index.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "plugin.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

namespace engram {

const nlohmann::json* json_path_lookup(const nlohmann::json& obj, const std::string& path) {
    const nlohmann::json* cur = &obj;
    for (const auto& part : split(path, '.')) {
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(part);
        if (it == cur->end()) return nullptr;
        cur = &(*it);
    }
    return cur;
}

bool where_matches(const nlohmann::json& metadata, const WhereFilter& where) {
    if (where.is_null() || where.empty()) return true;
    if (!where.is_object()) return false;
    for (auto& [path, expected] : where.items()) {
        const nlohmann::json* actual = json_path_lookup(metadata, path);
        if (!actual || *actual != expected) return false;
    }
    return true;
}

std::unique_ptr<SimilarityIndex> create_index(const Config& config,
                                              const std::string& collection) {
    const auto& backend = config.memory.backend;
    auto& registry = PluginRegistry::instance();

    if (!registry.has_index(backend)) {
        throw BackendUnavailableError("Unknown similarity index backend: " + backend);
    }
    return registry.create_index(backend, config, collection);
}

} // namespace engram
