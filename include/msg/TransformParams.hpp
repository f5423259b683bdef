#pragma once
#include <cstdint>

namespace msg {

// ----- Parameter ranges (UI slider bounds) -----
static constexpr int   BRIGHTNESS_MIN     = 0;      // percent
static constexpr int   BRIGHTNESS_MAX     = 200;
static constexpr int   BRIGHTNESS_DEFAULT = 100;

static constexpr int   CONTRAST_MIN       = 0;      // percent
static constexpr int   CONTRAST_MAX       = 200;
static constexpr int   CONTRAST_DEFAULT   = 100;

static constexpr float GAMMA_MIN          = 1.0f;
static constexpr float GAMMA_MAX          = 3.0f;
static constexpr float GAMMA_STEP         = 0.1f;   // slider granularity only
static constexpr float GAMMA_DEFAULT      = 2.2f;

static constexpr int   TEMPERATURE_MIN_K     = 3000;
static constexpr int   TEMPERATURE_MAX_K     = 10000;
static constexpr int   TEMPERATURE_STEP_K    = 100; // slider granularity only
static constexpr int   TEMPERATURE_NEUTRAL_K = 6500;

// Immutable per-render-pass snapshot of the colour transform controls.
// Values held by ParameterStore are always inside the ranges above.
struct TransformParameters {
    int   brightness      = BRIGHTNESS_DEFAULT;     // 0..200 %
    int   contrast        = CONTRAST_DEFAULT;       // 0..200 %
    float gamma           = GAMMA_DEFAULT;          // 1.0..3.0, never <= 0
    int   temperature_k   = TEMPERATURE_NEUTRAL_K;  // 3000..10000 K
};

inline bool operator==(const TransformParameters& a, const TransformParameters& b) {
    return a.brightness == b.brightness && a.contrast == b.contrast &&
           a.gamma == b.gamma && a.temperature_k == b.temperature_k;
}
inline bool operator!=(const TransformParameters& a, const TransformParameters& b) {
    return !(a == b);
}

} // namespace msg
