#pragma once
#include <cstdint>

namespace report {

// CIE 1931 chromaticity (x, y)
struct Chromaticity {
    double x = 0.0;
    double y = 0.0;
};

struct LinearRgb {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

// Measured display primaries, linear RGB 0..1, D65.
// Ideal sRGB panel: red {1,0,0}, green {0,1,0}, blue {0,0,1}.
struct DisplayPrimaries {
    LinearRgb red  {1.0, 0.0, 0.0};
    LinearRgb green{0.0, 1.0, 0.0};
    LinearRgb blue {0.0, 0.0, 1.0};
};

struct GamutTriangle {
    Chromaticity r{};
    Chromaticity g{};
    Chromaticity b{};
};

enum class StandardGamut : uint8_t {
    SRGB = 0,
    ADOBE_RGB,
    DCI_P3,
};
static constexpr uint8_t STANDARD_GAMUT_COUNT = 3;

const char* StandardGamutStr(StandardGamut g);
const GamutTriangle& standardTriangle(StandardGamut g);

struct GamutCoverage {
    GamutTriangle display{};             // display primaries in xy
    double display_area = 0.0;           // xy triangle area
    double percent[STANDARD_GAMUT_COUNT] = {0.0, 0.0, 0.0};  // indexed by StandardGamut

    double coverage(StandardGamut g) const { return percent[static_cast<uint8_t>(g)]; }
};

// Linear RGB (D65) -> xy. A black sample (X+Y+Z == 0) maps to (0, 0).
Chromaticity rgbToXy(const LinearRgb& rgb);

// Area of the xy triangle (shoelace, always >= 0)
double triangleArea(const GamutTriangle& t);

// Display triangle area as a percentage of each standard triangle area,
// rounded to two decimals. Degenerate (collinear) primaries give 0 %.
GamutCoverage computeGamutCoverage(const DisplayPrimaries& primaries);

} // namespace report
