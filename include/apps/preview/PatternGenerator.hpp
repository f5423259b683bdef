#pragma once
#include <array>
#include <cstdint>

#include "msg/PixelBuffer.hpp"
#include "msg/PatternSpec.hpp"

namespace preview {

// ---------------------------------------------------------------------------
// Synthetic calibration targets.
// Pure and deterministic: identical (spec, width, height) always produce a
// byte-identical buffer. All patterns are fully opaque (A = 255).
//
// GRAYSCALE     'steps' equal vertical bands, band i at level
//               round(i*255/(steps-1)). First column black, last column white.
// COLOR_CHECKER 24 reference swatches, 6 columns x 4 rows, row-major.
//               Cell = (width/6) x (height/4); the last column/row absorbs
//               the rounding remainder.
// CHECKERBOARD  square cells of 'cell_size' px, white where (row+col) is even.
//
// A zero-sized canvas yields an empty (0x0) buffer.
// ---------------------------------------------------------------------------
msg::PixelBuffer generatePattern(const msg::PatternSpec& spec, uint32_t width, uint32_t height);

// Reference swatch table, row-major. Stable across runs; never recomputed.
using SwatchTable = std::array<msg::Rgb8, msg::CHECKER_SWATCHES>;
const SwatchTable& colorCheckerSwatches();

// Gray level of band 'i' out of 'steps' (round half up).
uint8_t grayscaleLevel(uint32_t band, uint32_t steps);

} // namespace preview
