#pragma once
#include <cstdint>

#include "msg/PixelBuffer.hpp"

namespace preview {

// ---------------------------------------------------------------------------
// Column rule (all compositing paths):
//   column x shows the ORIGINAL      if x <  fraction * width
//   column x shows the TRANSFORMED   otherwise
// so fraction = 0 -> all transformed, fraction = 1 -> all original, and
// fraction = 0.5 on 100 px -> columns 0..49 original, 50..99 transformed.
// ---------------------------------------------------------------------------

// First transformed column for 'fraction' (0..width).
uint32_t splitColumn(float fraction, uint32_t width);

// Pure split composite, no overlay. Empty buffer if the inputs differ in
// size or violate the size invariant.
msg::PixelBuffer composite(const msg::PixelBuffer& original,
                           const msg::PixelBuffer& transformed,
                           float fraction);

struct SplitViewConfig {
    bool      draw_overlay    = true;
    uint8_t   divider_width_px = 2;                    // columns split-1 .. split
    msg::Rgb8 divider_color   {255, 255, 255};
    float     divider_alpha   = 0.5f;                  // blend toward divider_color
    uint16_t  handle_radius_px = 16;                   // drag handle disc, centred on the divider
    msg::Rgb8 handle_color    {255, 255, 255};
};

// ---------------------------------------------------------------------------
// SplitViewCompositor: owns the caller-visible surface bookkeeping.
//
// compose()        full O(w*h) copy of both sources + overlay.
// updateBoundary() boundary-only change: restores the pixels under the old
//                  overlay, recopies the columns between the old and new
//                  split, redraws the overlay. Never touches the transform.
// ---------------------------------------------------------------------------
class SplitViewCompositor {
public:
    explicit SplitViewCompositor(const SplitViewConfig& cfg = {});

    void setConfig(const SplitViewConfig& cfg);

    enum class Status : uint8_t {
        OK = 0,
        SIZE_MISMATCH,      // original/transformed differ in size
        INVALID_BUFFER,     // size invariant violated
    };
    static const char* StatusStr(Status s);

    bool compose(const msg::PixelBuffer& original,
                 const msg::PixelBuffer& transformed,
                 float fraction,
                 msg::PixelBuffer& surface);

    // Falls back to compose() if 'surface' was not produced by this
    // compositor from same-sized sources.
    bool updateBoundary(const msg::PixelBuffer& original,
                        const msg::PixelBuffer& transformed,
                        float fraction,
                        msg::PixelBuffer& surface);

    // Forget the last surface (next update is a full compose).
    void invalidate() { m_valid = false; }

    uint32_t fullComposeCount()  const { return m_full_composes; }
    uint32_t incrementalCount()  const { return m_incremental_updates; }
    uint64_t lastPixelsWritten() const { return m_last_pixels; }
    Status   lastStatus()        const { return m_status; }

private:
    struct Rect {
        uint32_t x0 = 0, y0 = 0, x1 = 0, y1 = 0;   // half-open
        bool empty() const { return x0 >= x1 || y0 >= y1; }
    };

    SplitViewConfig m_cfg{};

    bool     m_valid = false;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    uint32_t m_split = 0;          // first transformed column of the current surface
    Rect     m_divider_rect{};     // overlay footprint on the current surface
    Rect     m_handle_rect{};

    uint32_t m_full_composes = 0;
    uint32_t m_incremental_updates = 0;
    uint64_t m_last_pixels = 0;
    Status   m_status = Status::OK;

    bool checkInputs(const msg::PixelBuffer& original, const msg::PixelBuffer& transformed);

    // Copy [x0,x1) x [y0,y1) from the source selected by m_split.
    void copyRegion(const msg::PixelBuffer& original,
                    const msg::PixelBuffer& transformed,
                    const Rect& r,
                    msg::PixelBuffer& surface);

    void drawOverlay(msg::PixelBuffer& surface);

    bool fail(Status s);
};

} // namespace preview
