#pragma once
#include <cstdint>
#include <string>

#include "msg/PatternSpec.hpp"
#include "msg/TransformParams.hpp"

namespace msg {

// Caller-supplied accuracy metric (colour difference before/after correction).
struct DeltaEPair {
    float before = 0.0f;
    float after  = 0.0f;
};

struct WhiteBalanceGains {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
};

// Externally computed recommendation. Values are constants supplied by the
// recommendation service; nothing here is derived by the preview engine.
struct Recommendation {
    int   color_temperature_k = TEMPERATURE_NEUTRAL_K;
    float gamma               = GAMMA_DEFAULT;
    WhiteBalanceGains white_balance{};
    DeltaEPair delta_e{};
    std::string description;
};

// Brightness/contrast preset applied together with a recommendation
static constexpr int RECOMMENDED_BRIGHTNESS = 95;
static constexpr int RECOMMENDED_CONTRAST   = 110;

// Read-only record handed to the report/export consumer.
struct ReportSnapshot {
    TransformParameters params{};
    PatternKind pattern       = PatternKind::GRAYSCALE;
    float boundary_fraction   = 0.5f;
    DeltaEPair accuracy{};
    uint64_t   params_revision = 0;
    uint64_t   t_us            = 0;  // monotonic capture time
};

} // namespace msg
