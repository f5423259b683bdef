// PreviewTask.cpp
#include "apps/preview/PreviewTask.hpp"

#include <iostream>
#include <utility>

#include "apps/preview/PatternGenerator.hpp"

namespace preview {

static inline PreviewTaskConfig sanitise(const PreviewTaskConfig& in) {
    PreviewTaskConfig cfg = in;

    // Larger than any headset panel we preview
    if (cfg.canvas_width  > 8192) cfg.canvas_width  = 8192;
    if (cfg.canvas_height > 8192) cfg.canvas_height = 8192;

    if (cfg.tick_hz == 0)  cfg.tick_hz = 60;
    if (cfg.tick_hz > 240) cfg.tick_hz = 240;

    return cfg;
}

const char* PreviewTask::StatusStr(Status s) {
    switch (s) {
        case Status::OK:               return "OK";
        case Status::TRANSFORM_FAILED: return "TRANSFORM_FAILED";
        case Status::COMPOSE_FAILED:   return "COMPOSE_FAILED";
        case Status::PRESENT_FAILED:   return "PRESENT_FAILED";
        case Status::LOAD_FAILED:      return "LOAD_FAILED";
        default:                       return "UNKNOWN";
    }
}

PreviewTask::PreviewTask(ParameterStore& store,
                         platform::IRenderSurface* surface,
                         const PreviewTaskConfig& cfg)
: m_store(store)
, m_render(surface)
, m_cfg(sanitise(cfg))
, m_compositor(m_cfg.split) {}

// ==============================================
// Render tick
// ==============================================

bool PreviewTask::tick(RemoteCommandQueue* remote_in) {
    ++m_stats.ticks;

    // ---- 1) Remote commands, in arrival order ----
    if (remote_in) {
        uint32_t rejected = 0;
        const uint32_t n = m_store.drain(*remote_in, &rejected);
        m_stats.remote_applied  += n - rejected;
        m_stats.remote_rejected += rejected;
    }

    // ---- 2) One consistent view of the store ----
    const ParameterStore::Snapshot snap = m_store.snapshot();

    // A selection made before the first tick is not a switch request
    const bool first            = !m_have_snapshot;
    const bool pattern_selected = !first && snap.pattern_rev != m_seen_pattern_rev;
    const bool params_change    = first || snap.params_rev != m_seen_params_rev;
    const bool split_change     = first || snap.split_rev  != m_seen_split_rev;

    m_have_snapshot    = true;
    m_seen_pattern_rev = snap.pattern_rev;
    m_seen_params_rev  = snap.params_rev;
    m_seen_split_rev   = snap.split_rev;

    // ---- 3) Source ----
    if (pattern_selected) {
        if (m_source != SourceKind::PATTERN) {
            std::cout << "[PREVIEW] pattern selected, leaving image source\n";
            m_source = SourceKind::PATTERN;
        }
        m_source_dirty = true;
    }

    if (m_source == SourceKind::PATTERN && m_source_dirty) {
        m_original = generatePattern(snap.pattern, m_cfg.canvas_width, m_cfg.canvas_height);
        ++m_stats.pattern_generations;
    }

    // ---- 4) Transform + composite ----
    if (m_source_dirty || params_change) {
        m_source_dirty = false;

        if (!m_pipeline.run(m_original, snap.params, m_corrected)) {
            // Previous corrected frame stays on screen
            return fail(Status::TRANSFORM_FAILED);
        }
        m_stats.full_transforms = m_pipeline.runCount();

        if (!m_compositor.compose(m_original, m_corrected,
                                  snap.split.boundary_fraction, m_surface)) {
            return fail(Status::COMPOSE_FAILED);
        }
        return present();
    }

    if (split_change || snap.split.dragging) {
        if (!m_compositor.updateBoundary(m_original, m_corrected,
                                         snap.split.boundary_fraction, m_surface)) {
            return fail(Status::COMPOSE_FAILED);
        }
        ++m_stats.boundary_updates;
        return present();
    }

    return false;
}

// ==============================================
// Source selection
// ==============================================

bool PreviewTask::loadSource(platform::ISourceImage& source) {
    msg::PixelBuffer img;
    if (!source.load(m_cfg.canvas_width, img)) {
        m_load_error = true;
        ++m_stats.load_failures;
        std::cerr << "[PREVIEW] source load failed: " << source.lastErrorStr()
                  << " (keeping last frame)\n";
        return fail(Status::LOAD_FAILED);
    }
    if (!img.isValid()) {
        m_load_error = true;
        ++m_stats.load_failures;
        std::cerr << "[PREVIEW] source returned a malformed buffer (keeping last frame)\n";
        return fail(Status::LOAD_FAILED);
    }

    m_original     = std::move(img);
    m_source       = SourceKind::IMAGE;
    m_source_dirty = true;
    m_load_error   = false;
    m_status       = Status::OK;

    std::cout << "[PREVIEW] image source " << m_original.width << "x" << m_original.height << "\n";
    return true;
}

void PreviewTask::usePatternSource() {
    if (m_source == SourceKind::PATTERN) return;
    m_source = SourceKind::PATTERN;
    m_source_dirty = true;
}

void PreviewTask::setCanvasSize(uint32_t width, uint32_t height) {
    PreviewTaskConfig cfg = m_cfg;
    cfg.canvas_width  = width;
    cfg.canvas_height = height;
    m_cfg = sanitise(cfg);

    // An image keeps its decoded size until the next load
    if (m_source == SourceKind::PATTERN) m_source_dirty = true;
}

PreviewStats PreviewTask::stats() const {
    PreviewStats s = m_stats;
    s.full_transforms = m_pipeline.runCount();
    s.full_composes   = m_compositor.fullComposeCount();
    s.t_us            = Rtos::NowUs();
    return s;
}

// ==============================================
// Task
// ==============================================

void PreviewTask::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    if (!ctx || !ctx->self) {
        std::cerr << "[PREVIEW] TaskEntry: incomplete context\n";
        return;
    }
    ctx->self->Run(ctx->remote_in, ctx->stats_out, ctx->max_ticks);
}

void PreviewTask::Run(RemoteCommandQueue* remote_in, PreviewStatsQueue* stats_out, uint64_t max_ticks) {
    const uint64_t period_us = 1000000ull / m_cfg.tick_hz;
    uint64_t n = 0;

    std::cout << "[PREVIEW] render loop at " << m_cfg.tick_hz << " Hz\n";

    while (!StopRequested() && (max_ticks == 0 || n < max_ticks)) {
        const uint64_t t0 = Rtos::NowUs();

        (void)tick(remote_in);   // failures are logged; keep rendering
        ++n;

        if (stats_out) (void)stats_out->try_send(stats());

        const uint64_t spent = Rtos::NowUs() - t0;
        if (spent < period_us) {
            Rtos::SleepMs(static_cast<int>((period_us - spent) / 1000));
        }
    }

    std::cout << "[PREVIEW] render loop stopped after " << n << " ticks\n";
}

// -------------------- private helpers --------------------

bool PreviewTask::present() {
    // Zero-sized canvas: nothing to show
    if (m_surface.empty()) return false;

    if (m_render && !m_render->present(m_surface)) {
        return fail(Status::PRESENT_FAILED);
    }
    ++m_stats.frames;
    m_status = Status::OK;
    return true;
}

bool PreviewTask::fail(Status s) {
    m_status = s;
    std::cerr << "[PREVIEW] FAIL: " << StatusStr(s) << "\n";
    return false;
}

} // namespace preview
