#pragma once
#include <atomic>
#include <cstdint>

#include "os/rtos.hpp"

#include "apps/preview/ParameterStore.hpp"          // for RemoteCommandQueue
#include "apps/preview/ColorTransform.hpp"
#include "apps/preview/SplitViewCompositor.hpp"

#include "platform/IRenderSurface.hpp"
#include "platform/ISourceImage.hpp"

#include "msg/PixelBuffer.hpp"

namespace preview {

struct PreviewTaskConfig {
    uint32_t canvas_width  = 960;    // pattern canvas / requested source width
    uint32_t canvas_height = 540;
    uint32_t tick_hz       = 60;
    SplitViewConfig split{};
};

enum class SourceKind : uint8_t {
    PATTERN = 0,
    IMAGE   = 1,
};

struct PreviewStats {
    uint64_t ticks               = 0;
    uint64_t frames              = 0;   // present() calls
    uint32_t full_transforms     = 0;
    uint32_t pattern_generations = 0;
    uint32_t full_composes       = 0;
    uint32_t boundary_updates    = 0;
    uint32_t remote_applied      = 0;
    uint32_t remote_rejected     = 0;
    uint32_t load_failures       = 0;
    uint64_t t_us                = 0;
};

// ------------------------------
// Queue types (keep them explicit and boring)
// ------------------------------
// Optional telemetry tap (freshest wins)
using PreviewStatsQueue = Rtos::Queue<PreviewStats, 1>;

// ---------------------------------------------------------------------------
//  PreviewTask: cooperative render tick.
//
//  Per tick:
//   1. drain the remote command queue into the store
//   2. take one store snapshot
//   3. pattern selection changed -> back to the pattern source, regenerate
//   4. source or params changed  -> full transform + full compose
//      otherwise boundary moved or a drag is active -> compositor-only path
//      otherwise nothing is presented
//
//  Not thread-safe: tick(), loadSource() and the setters must be called
//  from the same thread.
// ---------------------------------------------------------------------------
class PreviewTask {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        PreviewTask*        self      = nullptr;
        RemoteCommandQueue* remote_in = nullptr;   // adapter -> store (optional)
        PreviewStatsQueue*  stats_out = nullptr;   // optional tap
        uint64_t            max_ticks = 0;         // 0 = until RequestStop()
    };

    enum class Status : uint8_t {
        OK = 0,
        TRANSFORM_FAILED,
        COMPOSE_FAILED,
        PRESENT_FAILED,
        LOAD_FAILED,
    };
    static const char* StatusStr(Status s);

public:
    PreviewTask(ParameterStore& store,
                platform::IRenderSurface* surface,
                const PreviewTaskConfig& cfg = {});

    // One render pass. Returns true if a frame was presented (or would have
    // been, when no render surface is attached).
    bool tick(RemoteCommandQueue* remote_in = nullptr);

    // Replace the current source with a decoded image. On failure the last
    // rendered buffers stay and loadError() is raised until the next
    // successful load.
    bool loadSource(platform::ISourceImage& source);

    // Back to the synthetic pattern of the store.
    void usePatternSource();

    // Pattern canvas size (0 allowed: empty buffers, nothing presented).
    void setCanvasSize(uint32_t width, uint32_t height);

    // OSAL-compatible entry point.
    static void TaskEntry(void* arg);

    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    const msg::PixelBuffer& original()  const { return m_original; }
    const msg::PixelBuffer& corrected() const { return m_corrected; }
    const msg::PixelBuffer& surface()   const { return m_surface; }

    SourceKind   sourceKind() const { return m_source; }
    bool         loadError()  const { return m_load_error; }
    PreviewStats stats()      const;
    Status       lastStatus() const { return m_status; }

    const ColorTransformPipeline& pipeline()   const { return m_pipeline; }
    const SplitViewCompositor&    compositor() const { return m_compositor; }

private:
    ParameterStore&            m_store;
    platform::IRenderSurface*  m_render = nullptr;
    PreviewTaskConfig          m_cfg{};

    ColorTransformPipeline m_pipeline;
    SplitViewCompositor    m_compositor;

    msg::PixelBuffer m_original;
    msg::PixelBuffer m_corrected;
    msg::PixelBuffer m_surface;

    SourceKind m_source = SourceKind::PATTERN;
    bool       m_source_dirty = true;
    bool       m_load_error = false;

    // Last snapshot revisions rendered
    bool     m_have_snapshot = false;
    uint64_t m_seen_pattern_rev = 0;
    uint64_t m_seen_params_rev  = 0;
    uint64_t m_seen_split_rev   = 0;

    std::atomic<bool> m_stop_requested{false};

    PreviewStats m_stats{};
    Status       m_status = Status::OK;

    void Run(RemoteCommandQueue* remote_in, PreviewStatsQueue* stats_out, uint64_t max_ticks);

    bool present();
    bool fail(Status s);
};

} // namespace preview
