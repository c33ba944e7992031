#pragma once
#include "../persistence.hpp"
#include <string>

namespace strata {

// One <dir>/<entity>.json file per entity, replaced atomically.
class JsonFileSink : public PersistenceSink {
public:
    explicit JsonFileSink(std::string dir);

    bool snapshot(const std::string& entity_id, const nlohmann::json& state) override;
    std::optional<nlohmann::json> load(const std::string& entity_id) override;
    std::string backend_name() const override { return "json"; }

    std::string path_for(const std::string& entity_id) const;

private:
    std::string dir_;
};

} // namespace strata
