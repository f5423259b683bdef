// OpenCvImageSource.cpp
#include "platform/linux/OpenCvImageSource.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/opencv.hpp>

namespace platform {

static inline ImageSourceConfig sanitise(const ImageSourceConfig& in) {
    ImageSourceConfig cfg = in;
    if (cfg.max_width == 0)  cfg.max_width  = 3840;
    if (cfg.max_height == 0) cfg.max_height = 2160;
    return cfg;
}

OpenCvImageSource::OpenCvImageSource(const ImageSourceConfig& cfg)
: m_cfg(sanitise(cfg)) {}

const char* OpenCvImageSource::StatusStr(Status s) {
    switch (s) {
        case Status::OK:                 return "OK";
        case Status::NO_PATH:            return "NO_PATH";
        case Status::OPEN_FAIL:          return "OPEN_FAIL";
        case Status::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case Status::CONVERT_FAIL:       return "CONVERT_FAIL";
        default:                         return "UNKNOWN";
    }
}

bool OpenCvImageSource::load(uint32_t target_width, msg::PixelBuffer& out) {
    if (m_cfg.path.empty()) return fail(Status::NO_PATH);

    cv::Mat img = cv::imread(m_cfg.path, cv::IMREAD_UNCHANGED);
    if (img.empty()) return fail(Status::OPEN_FAIL);

    cv::Mat rgba;
    try {
        // 16-bit -> 8-bit
        if (img.depth() == CV_16U) {
            cv::Mat tmp;
            img.convertTo(tmp, CV_8U, 1.0 / 257.0);
            img = tmp;
        } else if (img.depth() != CV_8U) {
            return fail(Status::UNSUPPORTED_FORMAT);
        }

        switch (img.channels()) {
            case 1: cv::cvtColor(img, rgba, cv::COLOR_GRAY2RGBA); break;
            case 3: cv::cvtColor(img, rgba, cv::COLOR_BGR2RGBA);  break;
            case 4: cv::cvtColor(img, rgba, cv::COLOR_BGRA2RGBA); break;
            default: return fail(Status::UNSUPPORTED_FORMAT);
        }

        // Scale to the requested width (aspect kept), then apply the caps
        double scale = 1.0;
        if (target_width > 0) {
            scale = static_cast<double>(target_width) / rgba.cols;
        }
        scale = std::min(scale, static_cast<double>(m_cfg.max_width) / rgba.cols);
        scale = std::min(scale, static_cast<double>(m_cfg.max_height) / rgba.rows);

        if (std::abs(scale - 1.0) > 1e-9) {
            const int w = std::max(1, static_cast<int>(std::lround(rgba.cols * scale)));
            const int h = std::max(1, static_cast<int>(std::lround(rgba.rows * scale)));
            cv::Mat scaled;
            cv::resize(rgba, scaled, cv::Size(w, h), 0.0, 0.0,
                       scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
            rgba = scaled;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[IMAGE] OpenCV: " << e.what() << "\n";
        return fail(Status::CONVERT_FAIL);
    }

    if (!rgba.isContinuous()) rgba = rgba.clone();

    msg::PixelBuffer buf(static_cast<uint32_t>(rgba.cols), static_cast<uint32_t>(rgba.rows));
    std::copy_n(rgba.data, buf.byteSize(), buf.data.begin());
    out = std::move(buf);

    std::cout << "[IMAGE] LOADED " << m_cfg.path << " "
              << out.width << "x" << out.height << "\n";
    m_status = Status::OK;
    return true;
}

bool OpenCvImageSource::fail(Status s) {
    m_status = s;
    std::cerr << "[IMAGE] LOAD FAIL path=" << m_cfg.path << " reason=" << StatusStr(s) << "\n";
    return false;
}

} // namespace platform
