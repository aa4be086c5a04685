#pragma once

#include <cstdint>
#include <string>

namespace cmdguard {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";     // debug | info | warn | error
};

struct BackendConfig {
    std::string type = "simulated";
    uint32_t min_latency_ms = 500;
    uint32_t max_latency_ms = 2500;
    double failure_rate = 0.0;
    uint64_t seed = 0;              // 0 = random
};

} // namespace cmdguard
