// test/preview_task_test.cpp
//
// PreviewTask render tick: dirty tracking, compositor-only path during a
// drag, remote commands drained per tick, source selection and load errors.
#include <iostream>

#include "os/rtos.hpp"
#include "apps/preview/ParameterStore.hpp"
#include "apps/preview/PreviewTask.hpp"
#include "apps/preview/PatternGenerator.hpp"
#include "platform/IRenderSurface.hpp"
#include "platform/ISourceImage.hpp"

static int g_failures = 0;

static void check(bool ok, const char* what) {
    if (ok) {
        std::cout << "[TEST] PASS: " << what << "\n";
    } else {
        std::cerr << "[TEST] FAIL: " << what << "\n";
        ++g_failures;
    }
}

class FakeSurface : public platform::IRenderSurface {
public:
    bool present(const msg::PixelBuffer& frame) override {
        ++presents;
        last = frame;
        return accept;
    }
    uint32_t presents = 0;
    msg::PixelBuffer last;
    bool accept = true;
};

class FakeSource : public platform::ISourceImage {
public:
    bool load(uint32_t target_width, msg::PixelBuffer& out) override {
        requested_width = target_width;
        if (!ok) return false;
        out = image;
        return true;
    }
    const char* lastErrorStr() const override { return ok ? "OK" : "OPEN_FAIL"; }

    msg::PixelBuffer image;
    bool ok = true;
    uint32_t requested_width = 0;
};

static msg::RemoteCommand remote(msg::RemoteCommandType t, int32_t delta = 0,
                                 msg::PatternKind k = msg::PatternKind::GRAYSCALE) {
    msg::RemoteCommand c{};
    c.type = t;
    c.delta = delta;
    c.pattern = k;
    return c;
}

int main() {
    std::cout << "=== PREVIEW TASK TEST ===\n";

    preview::PreviewTaskConfig cfg{};
    cfg.canvas_width  = 200;
    cfg.canvas_height = 100;

    // ---- First frame, then idle ----
    preview::ParameterStore store;
    FakeSurface surface;
    preview::PreviewTask task(store, &surface, cfg);
    preview::RemoteCommandQueue q;

    check(task.tick(&q), "first tick presents");
    check(surface.presents == 1 && surface.last.width == 200 && surface.last.height == 100, "canvas-sized frame presented");
    check(task.pipeline().runCount() == 1, "one full transform");
    check(task.stats().pattern_generations == 1, "one pattern generation");
    {
        const uint8_t* left  = surface.last.px(0, 0);
        const uint8_t* right = surface.last.px(199, 0);
        check(left[msg::CH_R] == 0 && right[msg::CH_R] == 255, "grayscale ramp black-left, white-right");
    }

    check(!task.tick(&q), "unchanged store -> nothing presented");
    check(surface.presents == 1 && task.pipeline().runCount() == 1, "idle tick did no work");

    // ---- Drag: compositor only ----
    check(store.beginDrag(1) == preview::ParameterStore::Status::OK, "drag started");
    for (int i = 0; i < 20; ++i) {
        (void)store.dragTo(1, 0.5f + 0.02f * static_cast<float>(i));
        (void)task.tick(&q);
    }
    check(task.pipeline().runCount() == 1, "20 drag ticks, zero transform re-runs");
    check(task.stats().boundary_updates == 20, "every drag tick took the boundary path");
    check(task.compositor().fullComposeCount() == 1, "no full compose while dragging");
    check(surface.presents == 21, "each drag tick presented");

    check(task.tick(&q), "drag in progress keeps presenting");
    (void)store.endDrag(1);
    (void)task.tick(&q);   // drag end bumps split_rev
    check(!task.tick(&q), "after drag end the loop goes idle");

    {
        preview::SplitViewCompositor ref;
        msg::PixelBuffer expect;
        (void)ref.compose(task.original(), task.corrected(), store.snapshot().split.boundary_fraction, expect);
        check(expect.data == task.surface().data, "incremental surface equals a full compose");
    }

    // ---- Parameter change: one full transform ----
    (void)store.setBrightness(80);
    check(task.tick(&q) && task.pipeline().runCount() == 2, "param change -> full transform");
    check(task.compositor().fullComposeCount() == 2, "param change -> full compose");

    // ---- Remote commands drained in the tick ----
    (void)q.try_send(remote(msg::RemoteCommandType::SET_PATTERN, 0, msg::PatternKind::COLOR_CHECKER));
    (void)q.try_send(remote(msg::RemoteCommandType::ADJUST_CONTRAST, 10));
    (void)q.try_send(remote(static_cast<msg::RemoteCommandType>(9)));
    check(task.tick(&q), "remote commands trigger a frame");
    check(task.stats().remote_applied == 2 && task.stats().remote_rejected == 1, "2 applied, 1 rejected");
    check(task.pipeline().runCount() == 3, "pattern + params in one tick -> one transform");
    check(task.stats().pattern_generations == 2, "checker generated once");
    {
        const msg::PixelBuffer expect = preview::generatePattern(msg::PatternSpec::ColorChecker(), 200, 100);
        check(task.original().data == expect.data, "original is the color checker");
    }

    // ---- Source image ----
    FakeSource src;
    src.image = preview::generatePattern(msg::PatternSpec::Checkerboard(8), 64, 32);
    check(task.loadSource(src), "image load succeeds");
    check(src.requested_width == 200, "provider asked for the canvas width");
    check(task.sourceKind() == preview::SourceKind::IMAGE && !task.loadError(), "image source active");
    check(task.tick(&q) && surface.last.width == 64 && surface.last.height == 32, "image defines the frame size");
    check(task.pipeline().runCount() == 4, "new source -> full transform");

    // ---- Load failure keeps the last frame ----
    const msg::PixelBuffer before = task.surface();
    src.ok = false;
    check(!task.loadSource(src), "failing load reported");
    check(task.loadError(), "load-error flag raised");
    check(task.lastStatus() == preview::PreviewTask::Status::LOAD_FAILED, "status LOAD_FAILED");
    check(task.original().width == 64 && task.surface().data == before.data, "last buffers kept");
    check(!task.tick(&q), "nothing re-rendered after a failed load");

    src.ok = true;
    check(task.loadSource(src) && !task.loadError(), "next successful load clears the flag");
    (void)task.tick(&q);

    // ---- Pattern selection returns to the pattern source ----
    (void)store.setPattern(msg::PatternKind::COLOR_CHECKER);   // same kind as before
    check(task.tick(&q), "selection re-renders");
    check(task.sourceKind() == preview::SourceKind::PATTERN, "back on the pattern source");
    check(surface.last.width == 200 && surface.last.height == 100, "canvas size restored");

    // ---- Reset from remote ----
    (void)q.try_send(remote(msg::RemoteCommandType::RESET));
    (void)task.tick(&q);
    {
        const preview::ParameterStore::Snapshot s = store.snapshot();
        check(s.params == msg::TransformParameters{} && s.pattern.kind == msg::PatternKind::GRAYSCALE,
              "remote reset applied in the tick");
        const msg::PixelBuffer expect = preview::generatePattern(msg::PatternSpec::Grayscale(), 200, 100);
        check(task.original().data == expect.data, "grayscale regenerated");
    }

    // ---- Zero-sized canvas ----
    {
        const uint32_t frames = surface.presents;
        task.setCanvasSize(0, 0);
        check(!task.tick(&q), "zero canvas presents nothing");
        check(task.original().empty() && surface.presents == frames, "empty buffers, surface untouched");
        task.setCanvasSize(120, 60);
        check(task.tick(&q) && surface.last.width == 120, "canvas resize re-renders");
    }

    // ---- Surface refusing frames ----
    {
        surface.accept = false;
        (void)store.setContrast(150);
        check(!task.tick(&q), "refused present reported");
        check(task.lastStatus() == preview::PreviewTask::Status::PRESENT_FAILED, "status PRESENT_FAILED");
        surface.accept = true;
    }

    // ---- No surface attached ----
    {
        preview::ParameterStore s2;
        preview::PreviewTask headless(s2, nullptr, cfg);
        check(headless.tick() && headless.stats().frames == 1, "headless task still renders");
    }

    // ---- Image loaded before the first tick is kept ----
    {
        preview::ParameterStore s4;
        FakeSurface surf4;
        preview::PreviewTask early(s4, &surf4, cfg);
        FakeSource img;
        img.image = preview::generatePattern(msg::PatternSpec::Checkerboard(4), 40, 20);
        check(early.loadSource(img), "early image load");
        check(early.tick() && surf4.last.width == 40, "first tick renders the image");
        check(early.sourceKind() == preview::SourceKind::IMAGE, "still on the image source");
        check(early.stats().pattern_generations == 0, "no pattern generated");
    }

    // ---- Task loop with the telemetry tap ----
    {
        preview::ParameterStore s3;
        FakeSurface surf3;
        preview::PreviewTaskConfig fast = cfg;
        fast.tick_hz = 240;
        preview::PreviewTask t3(s3, &surf3, fast);

        preview::RemoteCommandQueue q3;
        preview::PreviewStatsQueue stats_q(/*overwrite=*/true);
        (void)q3.try_send(remote(msg::RemoteCommandType::ADJUST_BRIGHTNESS, -20));

        preview::PreviewTask::TaskCtx ctx{};
        ctx.self      = &t3;
        ctx.remote_in = &q3;
        ctx.stats_out = &stats_q;
        ctx.max_ticks = 6;

        Rtos::Task render;
        check(render.Create("PreviewRender", preview::PreviewTask::TaskEntry, &ctx), "render task created");
        render.Join();

        preview::PreviewStats st{};
        check(stats_q.try_receive(st), "stats tap holds the freshest sample");
        check(st.ticks == 6, "loop ran max_ticks ticks");
        check(st.remote_applied == 1 && s3.params().brightness == 80, "queued remote command applied");
        check(surf3.presents == 1, "one frame, then idle");
    }

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] all preview task checks passed\n";
    return 0;
}
