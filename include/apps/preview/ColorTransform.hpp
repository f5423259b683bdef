#pragma once
#include <array>
#include <cstdint>

#include "msg/PixelBuffer.hpp"
#include "msg/TransformParams.hpp"

namespace preview {

// ---------------------------------------------------------------------------
// Per-pixel colour transform. Stages run in this order on R, G, B
// independently (alpha passes through untouched):
//
//   1. Brightness   c = c * brightness/100
//   2. Contrast     c = (c - 128) * f + 128,   f = (contrast/100)^2
//   3. Gamma        c = 255 * (c/255)^(1/gamma)
//   4. Tint         off = (K - 6500)/1000;  R += 10*off,  B -= 10*off
//
// Intermediate values are unbounded doubles. A single clamp to [0,255]
// follows stage 4, then rounding half up: out = floor(v + 0.5).
// A value below zero entering stage 3 has no real power and resolves to 0.
//
// gamma must be > 0 (ParameterStore guarantees it for stored values).
// ---------------------------------------------------------------------------

// Single channel through the four stages. channel = msg::CH_R / CH_G / CH_B.
uint8_t transformChannel(uint8_t value, uint8_t channel, const msg::TransformParameters& p);

// Each output channel depends only on its input byte, so one parameter set
// reduces to three 256-entry tables. Table lookup is bit-identical to the
// formula above.
struct ChannelLut {
    std::array<uint8_t, 256> r{};
    std::array<uint8_t, 256> g{};
    std::array<uint8_t, 256> b{};
};
ChannelLut buildChannelLut(const msg::TransformParameters& p);

// Pure transform: returns a new buffer of the same size.
// Returns an empty buffer if 'src' violates the size invariant or gamma <= 0.
msg::PixelBuffer transform(const msg::PixelBuffer& src, const msg::TransformParameters& p);

// ---------------------------------------------------------------------------
// ColorTransformPipeline: the render loop's handle on transform().
// Keeps a run counter so callers can verify when the O(w*h) path executes.
// ---------------------------------------------------------------------------
class ColorTransformPipeline {
public:
    enum class Status : uint8_t {
        OK = 0,
        INVALID_SOURCE,   // data.size() != width*height*4
        INVALID_PARAMS,   // gamma <= 0 or not finite
    };

    static const char* StatusStr(Status s);

    // Core API: consume one source buffer, produce one corrected buffer.
    // 'out' is replaced only on success.
    bool run(const msg::PixelBuffer& src, const msg::TransformParameters& p, msg::PixelBuffer& out);

    uint32_t runCount()   const { return m_runs; }
    Status   lastStatus() const { return m_status; }

private:
    uint32_t m_runs = 0;
    Status   m_status = Status::OK;

    bool fail(Status s);
};

} // namespace preview
