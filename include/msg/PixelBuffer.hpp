#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace msg {

// Pixel coords: origin = top-left; x → right, y → down (in pixels).
static constexpr uint32_t CHANNELS = 4; // R, G, B, A

// Channel offsets inside one pixel
enum : uint8_t { CH_R = 0, CH_G = 1, CH_B = 2, CH_A = 3 };

// Owning RGBA8 raster, row-major, tightly packed (stride == width * 4).
// Invariant: data.size() == width * height * 4.
struct PixelBuffer {
    uint32_t width  = 0;   // pixels
    uint32_t height = 0;   // pixels
    std::vector<uint8_t> data;

    PixelBuffer() = default;
    PixelBuffer(uint32_t w, uint32_t h)
    : width(w), height(h), data(static_cast<std::size_t>(w) * h * CHANNELS, 0) {}

    std::size_t byteSize() const { return static_cast<std::size_t>(width) * height * CHANNELS; }
    uint32_t    stride()   const { return width * CHANNELS; }

    bool empty()   const { return width == 0 || height == 0; }
    bool isValid() const { return data.size() == byteSize(); }

    bool sameSize(const PixelBuffer& o) const { return width == o.width && height == o.height; }

    std::size_t offset(uint32_t x, uint32_t y) const {
        return (static_cast<std::size_t>(y) * width + x) * CHANNELS;
    }

    uint8_t*       px(uint32_t x, uint32_t y)       { return data.data() + offset(x, y); }
    const uint8_t* px(uint32_t x, uint32_t y) const { return data.data() + offset(x, y); }
};

struct Rgb8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Rgb8& a, const Rgb8& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator!=(const Rgb8& a, const Rgb8& b) { return !(a == b); }

} // namespace msg
