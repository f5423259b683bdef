// ColorTransform.cpp
#include "apps/preview/ColorTransform.hpp"

#include <cmath>
#include <iostream>

namespace {

static inline bool gammaUsable(float gamma) {
    return std::isfinite(gamma) && gamma > 0.0f;
}

static inline uint8_t clampRound(double v) {
    if (!(v > 0.0)) return 0;          // also catches NaN
    if (v >= 255.0) return 255;
    return static_cast<uint8_t>(std::floor(v + 0.5));
}

} // anonymous namespace

namespace preview {

uint8_t transformChannel(uint8_t value, uint8_t channel, const msg::TransformParameters& p) {
    double c = static_cast<double>(value);

    // 1. Brightness
    c *= static_cast<double>(p.brightness) / 100.0;

    // 2. Contrast (quadratic response)
    const double k = static_cast<double>(p.contrast) / 100.0;
    c = (c - 128.0) * (k * k) + 128.0;

    // 3. Gamma
    if (c < 0.0) return 0;
    c = 255.0 * std::pow(c / 255.0, 1.0 / static_cast<double>(p.gamma));

    // 4. Colour temperature tint, 6500 K neutral
    const double offset = static_cast<double>(p.temperature_k - msg::TEMPERATURE_NEUTRAL_K) / 1000.0;
    if (channel == msg::CH_R) c += offset * 10.0;
    if (channel == msg::CH_B) c -= offset * 10.0;

    return clampRound(c);
}

ChannelLut buildChannelLut(const msg::TransformParameters& p) {
    ChannelLut lut;
    for (int v = 0; v < 256; ++v) {
        const uint8_t in = static_cast<uint8_t>(v);
        lut.r[v] = transformChannel(in, msg::CH_R, p);
        lut.g[v] = transformChannel(in, msg::CH_G, p);
        lut.b[v] = transformChannel(in, msg::CH_B, p);
    }
    return lut;
}

msg::PixelBuffer transform(const msg::PixelBuffer& src, const msg::TransformParameters& p) {
    if (!src.isValid() || !gammaUsable(p.gamma)) {
        return msg::PixelBuffer{};
    }

    const ChannelLut lut = buildChannelLut(p);

    msg::PixelBuffer out;
    out.width  = src.width;
    out.height = src.height;
    out.data.resize(src.data.size());

    // Flat mapping over all pixels; no cross-pixel dependency.
    const uint8_t* in = src.data.data();
    uint8_t* dst = out.data.data();
    const std::size_t n = src.data.size();
    for (std::size_t i = 0; i < n; i += msg::CHANNELS) {
        dst[i + msg::CH_R] = lut.r[in[i + msg::CH_R]];
        dst[i + msg::CH_G] = lut.g[in[i + msg::CH_G]];
        dst[i + msg::CH_B] = lut.b[in[i + msg::CH_B]];
        dst[i + msg::CH_A] = in[i + msg::CH_A];
    }
    return out;
}

// -------------------- ColorTransformPipeline --------------------

const char* ColorTransformPipeline::StatusStr(Status s) {
    switch (s) {
        case Status::OK:             return "OK";
        case Status::INVALID_SOURCE: return "INVALID_SOURCE";
        case Status::INVALID_PARAMS: return "INVALID_PARAMS";
        default:                     return "UNKNOWN";
    }
}

bool ColorTransformPipeline::run(const msg::PixelBuffer& src,
                                 const msg::TransformParameters& p,
                                 msg::PixelBuffer& out) {
    if (!src.isValid()) return fail(Status::INVALID_SOURCE);
    if (!gammaUsable(p.gamma)) return fail(Status::INVALID_PARAMS);

    ++m_runs;
    out = transform(src, p);
    m_status = Status::OK;
    return true;
}

bool ColorTransformPipeline::fail(Status s) {
    m_status = s;
    std::cerr << "[TRANSFORM] FAIL: " << StatusStr(s) << "\n";
    return false;
}

} // namespace preview
