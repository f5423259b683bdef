#pragma once
#include <cstdint>

#include "msg/PixelBuffer.hpp"

namespace platform {

// Source-image provider: decodes an image somewhere outside the preview core
// and hands it over as RGBA8. 'target_width' = 0 keeps the native size;
// otherwise the provider scales to that width keeping the aspect ratio.
// On failure 'out' is left untouched.
class ISourceImage {
public:
    virtual bool load(uint32_t target_width, msg::PixelBuffer& out) = 0;
    virtual const char* lastErrorStr() const = 0;
    virtual ~ISourceImage() = default;
};

} // namespace platform
