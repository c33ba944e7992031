#include "json_sink.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <fstream>
#include <iostream>

static strata::SinkRegistrar reg_json("json",
    [](const strata::PersistenceConfig& config) {
        std::string dir = config.path;
        if (dir.empty()) {
            dir = strata::expand_home("~/.strata/entities");
        }
        return std::make_unique<strata::JsonFileSink>(dir);
    });

namespace strata {

JsonFileSink::JsonFileSink(std::string dir) : dir_(std::move(dir)) {
    while (dir_.size() > 1 && dir_.back() == '/') dir_.pop_back();
}

std::string JsonFileSink::path_for(const std::string& entity_id) const {
    return dir_ + "/" + encode_entity_id(entity_id) + ".json";
}

bool JsonFileSink::snapshot(const std::string& entity_id, const nlohmann::json& state) {
    std::string path = path_for(entity_id);
    if (!atomic_write_file(path, state.dump(2))) {
        std::cerr << "[json_sink] Failed to write " << path << "\n";
        return false;
    }
    return true;
}

std::optional<nlohmann::json> JsonFileSink::load(const std::string& entity_id) {
    std::string path = path_for(entity_id);
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[json_sink] Ignoring corrupt snapshot " << path
                  << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace strata
