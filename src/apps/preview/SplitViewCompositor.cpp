// SplitViewCompositor.cpp
#include "apps/preview/SplitViewCompositor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace preview {

static inline SplitViewConfig sanitise(const SplitViewConfig& in) {
    SplitViewConfig cfg = in;

    if (cfg.divider_width_px < 1) cfg.divider_width_px = 1;
    if (cfg.divider_width_px > 8) cfg.divider_width_px = 8;

    if (!(cfg.divider_alpha >= 0.0f)) cfg.divider_alpha = 0.0f;   // also NaN
    if (cfg.divider_alpha > 1.0f) cfg.divider_alpha = 1.0f;

    if (cfg.handle_radius_px > 256) cfg.handle_radius_px = 256;

    return cfg;
}

static inline uint8_t blend(uint8_t dst, uint8_t src, float a) {
    const float v = static_cast<float>(dst) * (1.0f - a) + static_cast<float>(src) * a;
    return static_cast<uint8_t>(std::floor(v + 0.5f));
}

uint32_t splitColumn(float fraction, uint32_t width) {
    if (!(fraction > 0.0f)) return 0;          // 0, negative, NaN
    if (fraction >= 1.0f) return width;

    // x < s  <=>  x < ceil(s) for integer x
    const double s = static_cast<double>(fraction) * static_cast<double>(width);
    const double c = std::ceil(s);
    return (c >= static_cast<double>(width)) ? width : static_cast<uint32_t>(c);
}

msg::PixelBuffer composite(const msg::PixelBuffer& original,
                           const msg::PixelBuffer& transformed,
                           float fraction) {
    if (!original.isValid() || !transformed.isValid() || !original.sameSize(transformed)) {
        return msg::PixelBuffer{};
    }

    msg::PixelBuffer out(original.width, original.height);
    const uint32_t split = splitColumn(fraction, original.width);
    const std::size_t left_bytes = static_cast<std::size_t>(split) * msg::CHANNELS;
    const std::size_t row_bytes  = out.stride();

    for (uint32_t y = 0; y < out.height; ++y) {
        const std::size_t row = static_cast<std::size_t>(y) * row_bytes;
        std::copy_n(original.data.begin() + row, left_bytes, out.data.begin() + row);
        std::copy_n(transformed.data.begin() + row + left_bytes, row_bytes - left_bytes,
                    out.data.begin() + row + left_bytes);
    }
    return out;
}

// -------------------- SplitViewCompositor --------------------

SplitViewCompositor::SplitViewCompositor(const SplitViewConfig& cfg)
: m_cfg(sanitise(cfg)) {}

void SplitViewCompositor::setConfig(const SplitViewConfig& cfg) {
    m_cfg = sanitise(cfg);
    m_valid = false;   // overlay footprint may change
}

const char* SplitViewCompositor::StatusStr(Status s) {
    switch (s) {
        case Status::OK:             return "OK";
        case Status::SIZE_MISMATCH:  return "SIZE_MISMATCH";
        case Status::INVALID_BUFFER: return "INVALID_BUFFER";
        default:                     return "UNKNOWN";
    }
}

bool SplitViewCompositor::compose(const msg::PixelBuffer& original,
                                  const msg::PixelBuffer& transformed,
                                  float fraction,
                                  msg::PixelBuffer& surface) {
    if (!checkInputs(original, transformed)) return false;

    if (!surface.sameSize(original) || !surface.isValid()) {
        surface = msg::PixelBuffer(original.width, original.height);
    }

    m_width  = original.width;
    m_height = original.height;
    m_split  = splitColumn(fraction, m_width);
    m_last_pixels = 0;

    Rect all;
    all.x1 = m_width;
    all.y1 = m_height;
    copyRegion(original, transformed, all, surface);
    drawOverlay(surface);

    m_valid = true;
    ++m_full_composes;
    m_status = Status::OK;
    return true;
}

bool SplitViewCompositor::updateBoundary(const msg::PixelBuffer& original,
                                         const msg::PixelBuffer& transformed,
                                         float fraction,
                                         msg::PixelBuffer& surface) {
    if (!checkInputs(original, transformed)) return false;

    if (!m_valid || original.width != m_width || original.height != m_height ||
        !surface.sameSize(original) || !surface.isValid()) {
        return compose(original, transformed, fraction, surface);
    }

    const uint32_t old_split = m_split;
    const uint32_t new_split = splitColumn(fraction, m_width);
    m_last_pixels = 0;

    // 1) Undo the old overlay (old split still selects the sources)
    copyRegion(original, transformed, m_divider_rect, surface);
    copyRegion(original, transformed, m_handle_rect, surface);

    // 2) Columns that changed side
    m_split = new_split;
    if (old_split != new_split) {
        Rect band;
        band.x0 = std::min(old_split, new_split);
        band.x1 = std::max(old_split, new_split);
        band.y1 = m_height;
        copyRegion(original, transformed, band, surface);
    }

    // 3) Overlay at the new boundary
    drawOverlay(surface);

    ++m_incremental_updates;
    m_status = Status::OK;
    return true;
}

// -------------------- private helpers --------------------

bool SplitViewCompositor::checkInputs(const msg::PixelBuffer& original,
                                      const msg::PixelBuffer& transformed) {
    if (!original.isValid() || !transformed.isValid()) return fail(Status::INVALID_BUFFER);
    if (!original.sameSize(transformed)) return fail(Status::SIZE_MISMATCH);
    return true;
}

void SplitViewCompositor::copyRegion(const msg::PixelBuffer& original,
                                     const msg::PixelBuffer& transformed,
                                     const Rect& r,
                                     msg::PixelBuffer& surface) {
    if (r.empty()) return;

    const uint32_t x1 = std::min(r.x1, m_width);
    const uint32_t y1 = std::min(r.y1, m_height);
    if (r.x0 >= x1 || r.y0 >= y1) return;

    // [x0, a) from original, [b, x1) from transformed
    const uint32_t a = std::min(x1, m_split);
    const uint32_t b = std::max(r.x0, m_split);

    for (uint32_t y = r.y0; y < y1; ++y) {
        if (r.x0 < a) {
            const std::size_t off = surface.offset(r.x0, y);
            std::copy_n(original.data.begin() + off,
                        static_cast<std::size_t>(a - r.x0) * msg::CHANNELS,
                        surface.data.begin() + off);
        }
        if (b < x1) {
            const std::size_t off = surface.offset(b, y);
            std::copy_n(transformed.data.begin() + off,
                        static_cast<std::size_t>(x1 - b) * msg::CHANNELS,
                        surface.data.begin() + off);
        }
    }
    m_last_pixels += static_cast<uint64_t>(x1 - r.x0) * (y1 - r.y0);
}

void SplitViewCompositor::drawOverlay(msg::PixelBuffer& surface) {
    m_divider_rect = Rect{};
    m_handle_rect  = Rect{};

    if (!m_cfg.draw_overlay || m_width == 0 || m_height == 0) return;

    // ---- Divider: columns centred on the boundary (split-1, split for 2 px) ----
    const uint32_t dw   = m_cfg.divider_width_px;
    const uint32_t half = dw / 2;
    uint32_t x0 = (m_split > half) ? m_split - half : 0;
    if (x0 > m_width - 1) x0 = m_width - 1;
    const uint32_t x1 = std::min(x0 + dw, m_width);

    m_divider_rect = Rect{x0, 0, x1, m_height};

    const msg::Rgb8 dc = m_cfg.divider_color;
    const float     da = m_cfg.divider_alpha;
    for (uint32_t y = 0; y < m_height; ++y) {
        for (uint32_t x = x0; x < x1; ++x) {
            uint8_t* p = surface.px(x, y);
            p[msg::CH_R] = blend(p[msg::CH_R], dc.r, da);
            p[msg::CH_G] = blend(p[msg::CH_G], dc.g, da);
            p[msg::CH_B] = blend(p[msg::CH_B], dc.b, da);
        }
    }
    m_last_pixels += static_cast<uint64_t>(x1 - x0) * m_height;

    // ---- Handle: solid disc centred on the boundary at mid-height ----
    const int r = m_cfg.handle_radius_px;
    if (r == 0) return;

    const double cx = static_cast<double>(m_split);
    const double cy = static_cast<double>(m_height) / 2.0;
    const double r2 = static_cast<double>(r) * r;

    const int hx0 = std::max(0, static_cast<int>(m_split) - r);
    const int hx1 = std::min(static_cast<int>(m_width), static_cast<int>(m_split) + r);
    const int hy0 = std::max(0, static_cast<int>(cy) - r);
    const int hy1 = std::min(static_cast<int>(m_height), static_cast<int>(cy) + r + 1);
    if (hx0 >= hx1 || hy0 >= hy1) return;

    m_handle_rect = Rect{static_cast<uint32_t>(hx0), static_cast<uint32_t>(hy0),
                         static_cast<uint32_t>(hx1), static_cast<uint32_t>(hy1)};

    const msg::Rgb8 hc = m_cfg.handle_color;
    for (int y = hy0; y < hy1; ++y) {
        const double dy = (y + 0.5) - cy;
        for (int x = hx0; x < hx1; ++x) {
            const double dx = (x + 0.5) - cx;
            if (dx * dx + dy * dy > r2) continue;
            uint8_t* p = surface.px(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
            p[msg::CH_R] = hc.r;
            p[msg::CH_G] = hc.g;
            p[msg::CH_B] = hc.b;
            p[msg::CH_A] = 255;
        }
    }
    m_last_pixels += static_cast<uint64_t>(hx1 - hx0) * (hy1 - hy0);
}

bool SplitViewCompositor::fail(Status s) {
    m_status = s;
    std::cerr << "[COMPOSITOR] FAIL: " << StatusStr(s) << "\n";
    return false;
}

} // namespace preview
