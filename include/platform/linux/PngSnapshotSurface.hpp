#pragma once
#include <cstdint>
#include <string>

#include "platform/IRenderSurface.hpp"

namespace platform {

struct PngSnapshotConfig {
    std::string out_dir = "tools/data/tmp/preview";
    std::string prefix  = "frame";
    uint32_t    every_n = 1;          // write every n-th presented frame
};

// ---------------------------------------------------------------------------
// PngSnapshotSurface: render surface that writes presented frames to
// <out_dir>/<prefix>_<NNNNNN>.png via OpenCV.
// ---------------------------------------------------------------------------
class PngSnapshotSurface : public IRenderSurface {
public:
    explicit PngSnapshotSurface(const PngSnapshotConfig& cfg = {});

    bool present(const msg::PixelBuffer& frame) override;

    // Write one buffer to an explicit path (RGBA8 -> PNG).
    static bool writePng(const msg::PixelBuffer& frame, const std::string& path);

    uint32_t presentedCount() const { return m_presented; }
    uint32_t writtenCount()   const { return m_written; }
    const std::string& lastPath() const { return m_last_path; }

private:
    PngSnapshotConfig m_cfg{};
    uint32_t m_presented = 0;
    uint32_t m_written = 0;
    bool     m_dir_ready = false;
    std::string m_last_path;
};

} // namespace platform
