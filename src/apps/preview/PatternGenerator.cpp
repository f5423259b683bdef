// PatternGenerator.cpp
#include "apps/preview/PatternGenerator.hpp"

#include <algorithm>

namespace {

// Classic 24-patch chart, sRGB 8-bit.
// Rows: naturals, miscellaneous, primaries/secondaries, neutral ramp.
const preview::SwatchTable kSwatches = {{
    {0x73, 0x52, 0x44}, {0xc2, 0x96, 0x82}, {0x62, 0x7a, 0x9d},
    {0x57, 0x6c, 0x43}, {0x85, 0x80, 0xb1}, {0x67, 0xbd, 0xaa},

    {0xd6, 0x7e, 0x2c}, {0x50, 0x5b, 0xa6}, {0xc1, 0x5a, 0x63},
    {0x5e, 0x3c, 0x6c}, {0x9d, 0xbc, 0x40}, {0xe0, 0xa3, 0x2e},

    {0x38, 0x3d, 0x96}, {0x46, 0x94, 0x49}, {0xaf, 0x36, 0x3c},
    {0xe7, 0xc7, 0x1f}, {0xbb, 0x56, 0x95}, {0x08, 0x85, 0xa1},

    {0xf3, 0xf3, 0xf2}, {0xc7, 0xc8, 0xc8}, {0xa0, 0xa0, 0xa0},
    {0x7a, 0x7a, 0x79}, {0x55, 0x55, 0x55}, {0x34, 0x34, 0x34},
}};

inline void put(uint8_t* p, uint8_t r, uint8_t g, uint8_t b) {
    p[msg::CH_R] = r;
    p[msg::CH_G] = g;
    p[msg::CH_B] = b;
    p[msg::CH_A] = 255;
}

// Band under column x. Wide canvases use the plain partition
// floor(x*steps/width). Canvases narrower than the band count map the first
// and last columns onto the first and last bands so both ends survive.
uint32_t bandOfColumn(uint32_t x, uint32_t width, uint32_t steps) {
    if (width >= steps) {
        return static_cast<uint32_t>((uint64_t(x) * steps) / width);
    }
    if (width == 1) return 0;
    const uint64_t num = uint64_t(x) * (steps - 1);
    const uint64_t den = width - 1;
    return static_cast<uint32_t>((2 * num + den) / (2 * den)); // round half up
}

// Cell index along one axis with remainder absorbed by the last cell.
uint32_t cellOf(uint32_t pos, uint32_t extent, uint32_t cells) {
    const uint32_t size = extent / cells;
    if (size == 0) return pos;                 // canvas smaller than the grid
    return std::min(pos / size, cells - 1);
}

void fillGrayscale(msg::PixelBuffer& buf, uint32_t steps) {
    if (steps < 2) steps = 2;

    // One level per column, then replicate rows
    for (uint32_t x = 0; x < buf.width; ++x) {
        const uint8_t g = preview::grayscaleLevel(bandOfColumn(x, buf.width, steps), steps);
        put(buf.px(x, 0), g, g, g);
    }
    const std::size_t row_bytes = buf.stride();
    for (uint32_t y = 1; y < buf.height; ++y) {
        std::copy_n(buf.data.begin(), row_bytes, buf.data.begin() + y * row_bytes);
    }
}

void fillColorChecker(msg::PixelBuffer& buf) {
    for (uint32_t y = 0; y < buf.height; ++y) {
        const uint32_t row = cellOf(y, buf.height, msg::CHECKER_ROWS);
        for (uint32_t x = 0; x < buf.width; ++x) {
            const uint32_t col = cellOf(x, buf.width, msg::CHECKER_COLS);
            const msg::Rgb8& c = kSwatches[row * msg::CHECKER_COLS + col];
            put(buf.px(x, y), c.r, c.g, c.b);
        }
    }
}

void fillCheckerboard(msg::PixelBuffer& buf, uint32_t cell) {
    if (cell == 0) cell = msg::CHECKERBOARD_CELL;

    for (uint32_t y = 0; y < buf.height; ++y) {
        const uint32_t row = y / cell;
        for (uint32_t x = 0; x < buf.width; ++x) {
            const uint32_t col = x / cell;
            const uint8_t v = ((row + col) % 2 == 0) ? 255 : 0;
            put(buf.px(x, y), v, v, v);
        }
    }
}

} // anonymous namespace

namespace preview {

const SwatchTable& colorCheckerSwatches() {
    return kSwatches;
}

uint8_t grayscaleLevel(uint32_t band, uint32_t steps) {
    if (steps < 2) return 0;
    if (band >= steps) band = steps - 1;
    const uint64_t num = uint64_t(band) * 255u;
    const uint64_t den = steps - 1;
    return static_cast<uint8_t>((2 * num + den) / (2 * den));
}

msg::PixelBuffer generatePattern(const msg::PatternSpec& spec, uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return msg::PixelBuffer{};
    }

    msg::PixelBuffer buf(width, height);

    switch (spec.kind) {
        case msg::PatternKind::GRAYSCALE:
            fillGrayscale(buf, spec.steps);
            break;
        case msg::PatternKind::COLOR_CHECKER:
            fillColorChecker(buf);
            break;
        case msg::PatternKind::CHECKERBOARD:
            fillCheckerboard(buf, spec.cell_size);
            break;
    }
    return buf;
}

} // namespace preview
