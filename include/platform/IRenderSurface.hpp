#pragma once

#include "msg/PixelBuffer.hpp"

namespace platform {

// Caller-owned 2D raster target. present() receives the composited RGBA8
// frame; the surface decides how it reaches a display (or a file).
class IRenderSurface {
public:
    virtual bool present(const msg::PixelBuffer& frame) = 0;
    virtual ~IRenderSurface() = default;
};

} // namespace platform
