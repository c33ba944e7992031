#pragma once
#include "../persistence.hpp"

namespace strata {

// Keeps nothing; every entity starts empty.
class NoneSink : public PersistenceSink {
public:
    bool snapshot(const std::string&, const nlohmann::json&) override { return true; }
    std::optional<nlohmann::json> load(const std::string&) override { return std::nullopt; }
    std::string backend_name() const override { return "none"; }
};

} // namespace strata
