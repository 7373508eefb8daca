#include "shared_state.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fstream>
#include <iostream>

namespace engram {

static void apply_updates(nlohmann::json& doc, const nlohmann::json& updates) {
    if (!doc.is_object()) doc = nlohmann::json::object();
    if (updates.is_object()) {
        for (auto& [key, value] : updates.items()) {
            doc[key] = value;
        }
    }
    doc["last_updated"] = timestamp_now();
}

JsonFileSharedState::JsonFileSharedState(const std::string& path) : path_(path) {
    if (path_.empty()) throw ValidationError("JsonFileSharedState: path is required");
}

nlohmann::json JsonFileSharedState::read_locked() const {
    std::ifstream file(path_);
    if (!file.is_open()) return nlohmann::json::object();

    try {
        auto j = nlohmann::json::parse(file);
        if (j.is_object()) return j;
        std::cerr << "[shared_state] Warning: " << path_ << " is not an object, ignoring\n";
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[shared_state] Warning: failed to parse " << path_ << ": "
                  << e.what() << "\n";
    }
    return nlohmann::json::object();
}

nlohmann::json JsonFileSharedState::read() {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_locked();
}

void JsonFileSharedState::merge(const nlohmann::json& updates) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = read_locked();
    apply_updates(doc, updates);
    if (!atomic_write_file(path_, doc.dump(2) + "\n")) {
        throw BackendUnavailableError("Failed to write shared state: " + path_);
    }
}

nlohmann::json InMemorySharedState::read() {
    std::lock_guard<std::mutex> lock(mutex_);
    return doc_;
}

void InMemorySharedState::merge(const nlohmann::json& updates) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply_updates(doc_, updates);
}

} // namespace engram
