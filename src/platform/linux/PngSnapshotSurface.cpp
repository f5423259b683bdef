// PngSnapshotSurface.cpp
#include "platform/linux/PngSnapshotSurface.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <opencv2/opencv.hpp>

namespace platform {

static inline PngSnapshotConfig sanitise(const PngSnapshotConfig& in) {
    PngSnapshotConfig cfg = in;
    if (cfg.every_n == 0) cfg.every_n = 1;
    if (cfg.prefix.empty()) cfg.prefix = "frame";
    if (cfg.out_dir.empty()) cfg.out_dir = ".";
    return cfg;
}

PngSnapshotSurface::PngSnapshotSurface(const PngSnapshotConfig& cfg)
: m_cfg(sanitise(cfg)) {}

bool PngSnapshotSurface::writePng(const msg::PixelBuffer& frame, const std::string& path) {
    if (frame.empty() || !frame.isValid()) {
        std::cerr << "[SURFACE] refusing to write empty frame to " << path << "\n";
        return false;
    }

    // Non-owning view over the RGBA buffer
    const cv::Mat rgba(static_cast<int>(frame.height), static_cast<int>(frame.width), CV_8UC4,
                       const_cast<uint8_t*>(frame.data.data()), frame.stride());
    cv::Mat bgra;
    cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);

    if (!cv::imwrite(path, bgra)) {
        std::cerr << "[SURFACE] imwrite failed: " << path << "\n";
        return false;
    }
    return true;
}

bool PngSnapshotSurface::present(const msg::PixelBuffer& frame) {
    const uint32_t n = m_presented++;
    if (n % m_cfg.every_n != 0) return true;

    if (!m_dir_ready) {
        std::error_code ec;
        std::filesystem::create_directories(m_cfg.out_dir, ec);
        if (ec) {
            std::cerr << "[SURFACE] cannot create " << m_cfg.out_dir << ": " << ec.message() << "\n";
            return false;
        }
        m_dir_ready = true;
    }

    char name[64];
    std::snprintf(name, sizeof(name), "_%06u.png", n);
    const std::string path = m_cfg.out_dir + "/" + m_cfg.prefix + name;

    if (!writePng(frame, path)) return false;

    m_last_path = path;
    ++m_written;
    std::cout << "[SURFACE] WROTE " << path << "\n";
    return true;
}

} // namespace platform
