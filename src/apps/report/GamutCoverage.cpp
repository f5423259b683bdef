// GamutCoverage.cpp
#include "apps/report/GamutCoverage.hpp"

#include <cmath>

#include <Eigen/Core>

namespace {

using EVec3 = Eigen::Vector3d;
using EMat3 = Eigen::Matrix3d;

// Linear sRGB -> XYZ, D65
static inline EMat3 rgbToXyzMatrix() {
    EMat3 M;
    M << 0.4124564, 0.3575761, 0.1804375,
         0.2126729, 0.7151522, 0.0721750,
         0.0193339, 0.1191920, 0.9503041;
    return M;
}

static inline EVec3 toE(const report::LinearRgb& c) { return {c.r, c.g, c.b}; }

static inline double round2(double v) {
    return std::floor(v * 100.0 + 0.5) / 100.0;
}

// Below this the triangle is treated as collinear
static constexpr double AREA_EPS = 1e-12;

static const report::GamutTriangle kStandard[report::STANDARD_GAMUT_COUNT] = {
    // sRGB
    {{0.6400, 0.3300}, {0.3000, 0.6000}, {0.1500, 0.0600}},
    // Adobe RGB (1998)
    {{0.6400, 0.3300}, {0.2100, 0.7100}, {0.1500, 0.0600}},
    // DCI-P3 (D65 white)
    {{0.6800, 0.3200}, {0.2650, 0.6900}, {0.1500, 0.0600}},
};

} // anonymous namespace

namespace report {

const char* StandardGamutStr(StandardGamut g) {
    switch (g) {
        case StandardGamut::SRGB:      return "sRGB";
        case StandardGamut::ADOBE_RGB: return "AdobeRGB";
        case StandardGamut::DCI_P3:    return "DCI-P3";
        default:                       return "UNKNOWN";
    }
}

const GamutTriangle& standardTriangle(StandardGamut g) {
    const uint8_t i = static_cast<uint8_t>(g);
    return kStandard[i < STANDARD_GAMUT_COUNT ? i : 0];
}

Chromaticity rgbToXy(const LinearRgb& rgb) {
    static const EMat3 M = rgbToXyzMatrix();
    const EVec3 xyz = M * toE(rgb);

    const double sum = xyz.sum();
    if (sum == 0.0) return Chromaticity{};
    return Chromaticity{xyz.x() / sum, xyz.y() / sum};
}

double triangleArea(const GamutTriangle& t) {
    const Eigen::Vector2d r(t.r.x, t.r.y);
    const Eigen::Vector2d g(t.g.x, t.g.y);
    const Eigen::Vector2d b(t.b.x, t.b.y);

    const Eigen::Vector2d e1 = g - r;
    const Eigen::Vector2d e2 = b - r;
    return 0.5 * std::abs(e1.x() * e2.y() - e1.y() * e2.x());
}

GamutCoverage computeGamutCoverage(const DisplayPrimaries& primaries) {
    GamutCoverage out;
    out.display.r = rgbToXy(primaries.red);
    out.display.g = rgbToXy(primaries.green);
    out.display.b = rgbToXy(primaries.blue);

    double area = triangleArea(out.display);
    if (!std::isfinite(area) || area < AREA_EPS) area = 0.0;
    out.display_area = area;

    for (uint8_t i = 0; i < STANDARD_GAMUT_COUNT; ++i) {
        const double ref = triangleArea(kStandard[i]);
        out.percent[i] = (ref > 0.0) ? round2(area / ref * 100.0) : 0.0;
    }
    return out;
}

} // namespace report
