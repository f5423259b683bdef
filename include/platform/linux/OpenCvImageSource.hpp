#pragma once
#include <cstdint>
#include <string>

#include "platform/ISourceImage.hpp"

namespace platform {

struct ImageSourceConfig {
    std::string path;                 // any format cv::imread understands
    uint32_t    max_width  = 3840;    // safety cap after scaling
    uint32_t    max_height = 2160;
};

// ---------------------------------------------------------------------------
// OpenCvImageSource: decodes a still image with OpenCV and converts it to
// RGBA8 (GRAY, BGR, BGRA; 8- or 16-bit). Scaling uses INTER_AREA.
// ---------------------------------------------------------------------------
class OpenCvImageSource : public ISourceImage {
public:
    explicit OpenCvImageSource(const ImageSourceConfig& cfg);

    bool load(uint32_t target_width, msg::PixelBuffer& out) override;
    const char* lastErrorStr() const override { return StatusStr(m_status); }

    enum class Status : uint8_t {
        OK = 0,
        NO_PATH,
        OPEN_FAIL,            // missing file or undecodable
        UNSUPPORTED_FORMAT,   // channel count / depth we do not convert
        CONVERT_FAIL,
    };
    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }

private:
    ImageSourceConfig m_cfg{};
    Status m_status = Status::OK;

    bool fail(Status s);
};

} // namespace platform
