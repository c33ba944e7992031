#include "none_sink.hpp"
#include "../plugin.hpp"

static strata::SinkRegistrar reg_none("none",
    [](const strata::PersistenceConfig&) { return std::make_unique<strata::NoneSink>(); });
