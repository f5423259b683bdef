// test/preview_patterngenerator_test.cpp
//
// Synthetic calibration targets: grayscale ramp bounds and monotonicity,
// 24-swatch chart layout, checkerboard parity, degenerate canvases.
#include <iostream>
#include <set>

#include "apps/preview/PatternGenerator.hpp"

static int g_failures = 0;

static void check(bool ok, const char* what) {
    if (ok) {
        std::cout << "[TEST] PASS: " << what << "\n";
    } else {
        std::cerr << "[TEST] FAIL: " << what << "\n";
        ++g_failures;
    }
}

static msg::Rgb8 rgbAt(const msg::PixelBuffer& b, uint32_t x, uint32_t y) {
    const uint8_t* p = b.px(x, y);
    return msg::Rgb8{p[msg::CH_R], p[msg::CH_G], p[msg::CH_B]};
}

static bool allOpaque(const msg::PixelBuffer& b) {
    for (std::size_t i = msg::CH_A; i < b.data.size(); i += msg::CHANNELS) {
        if (b.data[i] != 255) return false;
    }
    return true;
}

static void testGrayscale(uint32_t w, uint32_t h) {
    std::cout << "--- grayscale " << w << "x" << h << " ---\n";
    const msg::PixelBuffer b = preview::generatePattern(msg::PatternSpec::Grayscale(), w, h);

    check(b.width == w && b.height == h && b.isValid(), "size invariant holds");
    check(rgbAt(b, 0, 0) == (msg::Rgb8{0, 0, 0}), "leftmost column is black");
    check(rgbAt(b, w - 1, h - 1) == (msg::Rgb8{255, 255, 255}), "rightmost column is white");

    bool monotonic = true;
    bool neutral = true;
    bool rows_equal = true;
    for (uint32_t x = 0; x < w; ++x) {
        const msg::Rgb8 c = rgbAt(b, x, 0);
        if (c.r != c.g || c.g != c.b) neutral = false;
        if (x > 0 && c.r < rgbAt(b, x - 1, 0).r) monotonic = false;
        if (rgbAt(b, x, h - 1) != c) rows_equal = false;
    }
    check(monotonic, "levels non-decreasing left to right");
    check(neutral, "every band is neutral gray");
    check(rows_equal, "bands are vertical");
    check(allOpaque(b), "alpha is 255 everywhere");
}

int main() {
    std::cout << "=== PATTERN GENERATOR TEST ===\n";

    // ---- Grayscale ----
    testGrayscale(1024, 8);   // 4 px per band
    testGrayscale(960, 540);  // non-integer band width
    testGrayscale(100, 3);    // fewer columns than bands

    check(preview::grayscaleLevel(0, 256) == 0, "band 0 of 256 -> 0");
    check(preview::grayscaleLevel(255, 256) == 255, "band 255 of 256 -> 255");
    check(preview::grayscaleLevel(1, 3) == 128, "band 1 of 3 -> 127.5 rounds up to 128");
    check(preview::grayscaleLevel(1, 4) == 85, "band 1 of 4 -> 85");

    {
        // 1024 px / 256 bands: column x is band x/4, level == band
        const msg::PixelBuffer b = preview::generatePattern(msg::PatternSpec::Grayscale(), 1024, 1);
        check(rgbAt(b, 4, 0).r == 1 && rgbAt(b, 7, 0).r == 1 && rgbAt(b, 8, 0).r == 2,
              "column x belongs to band floor(x*steps/width)");
    }

    // ---- ColorChecker ----
    const uint32_t sizes[][2] = {{600, 400}, {1000, 700}, {13, 9}};
    for (const auto& sz : sizes) {
        const uint32_t w = sz[0];
        const uint32_t h = sz[1];
        std::cout << "--- colorchecker " << w << "x" << h << " ---\n";
        const msg::PixelBuffer b = preview::generatePattern(msg::PatternSpec::ColorChecker(), w, h);

        const uint32_t cw = w / msg::CHECKER_COLS;
        const uint32_t ch = h / msg::CHECKER_ROWS;
        const preview::SwatchTable& table = preview::colorCheckerSwatches();

        bool cells_match = true;
        std::set<uint32_t> distinct;
        for (uint32_t r = 0; r < msg::CHECKER_ROWS; ++r) {
            for (uint32_t c = 0; c < msg::CHECKER_COLS; ++c) {
                const msg::Rgb8 px = rgbAt(b, c * cw + cw / 2, r * ch + ch / 2);
                if (px != table[r * msg::CHECKER_COLS + c]) cells_match = false;
                distinct.insert((uint32_t(px.r) << 16) | (uint32_t(px.g) << 8) | px.b);
            }
        }
        check(cells_match, "cell centres show the row-major swatch table");
        check(distinct.size() == msg::CHECKER_SWATCHES, "24 distinct cells");
        check(rgbAt(b, w - 1, h - 1) == table[msg::CHECKER_SWATCHES - 1],
              "bottom-right remainder belongs to the last swatch");
        check(allOpaque(b), "alpha is 255 everywhere");
    }

    {
        const preview::SwatchTable& t = preview::colorCheckerSwatches();
        check(t[0] == (msg::Rgb8{0x73, 0x52, 0x44}), "swatch 0 is 735244");
        check(t[17] == (msg::Rgb8{0x08, 0x85, 0xa1}), "swatch 17 is 0885a1");
        check(t[23] == (msg::Rgb8{0x34, 0x34, 0x34}), "swatch 23 is 343434");
    }

    // ---- Checkerboard ----
    {
        std::cout << "--- checkerboard 100x90 ---\n";
        const msg::PixelBuffer b = preview::generatePattern(msg::PatternSpec::Checkerboard(), 100, 90);
        const msg::Rgb8 white{255, 255, 255};
        const msg::Rgb8 black{0, 0, 0};
        check(rgbAt(b, 0, 0) == white, "cell (0,0) is white");
        check(rgbAt(b, 39, 39) == white, "cell (0,0) spans 40 px");
        check(rgbAt(b, 40, 0) == black, "cell (0,1) is black");
        check(rgbAt(b, 40, 40) == white, "cell (1,1) is white");
        check(rgbAt(b, 99, 89) == white, "clipped edge cell (2,2) is white");
        check(rgbAt(b, 99, 0) == white && rgbAt(b, 0, 89) == white, "clipped cells keep parity");
        check(allOpaque(b), "alpha is 255 everywhere");
    }

    // ---- Determinism / degenerate canvases ----
    {
        const msg::PixelBuffer a = preview::generatePattern(msg::PatternSpec::ColorChecker(), 321, 123);
        const msg::PixelBuffer b = preview::generatePattern(msg::PatternSpec::ColorChecker(), 321, 123);
        check(a.data == b.data, "identical inputs produce identical buffers");
    }
    {
        const msg::PixelBuffer z1 = preview::generatePattern(msg::PatternSpec::Grayscale(), 0, 100);
        const msg::PixelBuffer z2 = preview::generatePattern(msg::PatternSpec::Checkerboard(), 100, 0);
        check(z1.width == 0 && z1.height == 0 && z1.data.empty(), "zero width -> empty buffer");
        check(z2.width == 0 && z2.height == 0 && z2.data.empty(), "zero height -> empty buffer");
    }
    {
        const msg::PixelBuffer one = preview::generatePattern(msg::PatternSpec::Grayscale(), 1, 1);
        check(one.isValid() && rgbAt(one, 0, 0) == (msg::Rgb8{0, 0, 0}), "1x1 grayscale is the first band");
    }

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] all pattern checks passed\n";
    return 0;
}
