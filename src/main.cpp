// hmdcal_preview: headless run of the preview engine.
//
//   hmdcal_preview [image] [out_dir]
//
// Renders the default pattern, replays a scripted remote-control session
// from a second task, simulates a drag of the split handle and writes PNG
// snapshots of the composited surface to out_dir.
#include <iostream>
#include <string>

#include "os/rtos.hpp"

#include "apps/preview/ParameterStore.hpp"
#include "apps/preview/RemoteCommandAdapter.hpp"
#include "apps/preview/DragController.hpp"
#include "apps/preview/PreviewTask.hpp"
#include "apps/report/GamutCoverage.hpp"

#include "platform/LocalPointerEvents.hpp"
#include "platform/linux/OpenCvImageSource.hpp"
#include "platform/linux/PngSnapshotSurface.hpp"

// Define the RTOS task objects
Rtos::Task RemoteTransportTask;
Rtos::Task RemoteAdapterTask;
Rtos::Task PreviewRenderTask;

// ---- QUEUES ----
preview::RemoteCommandQueue remoteCommandQueue(/*overwrite=*/false);
preview::RemoteInboxQueue   remoteInboxQueue(/*overwrite=*/false);
preview::PreviewStatsQueue  previewStatsQueue(/*overwrite=*/true);

static msg::RemoteMessage makeMessage(const char* type, const char* key = nullptr, const char* value = nullptr) {
    msg::RemoteMessage m;
    m.type = type;
    if (key && value) m.fields[key] = value;
    return m;
}

// === Simulated remote-control transport ===
// Delivers decoded records the way the dashboard's channel would.
void RemoteTransport(void*) {
    const msg::RemoteMessage script[] = {
        makeMessage("SET_PATTERN", "patternId", "colorchecker"),
        makeMessage("ADJUST_BRIGHTNESS", "value", "-5"),
        makeMessage("ADJUST_CONTRAST", "value", "10"),
        makeMessage("ADJUST_CONTRAST", "value", "ten"),    // malformed, dropped
        makeMessage("SET_PATTERN", "patternId", "checkerboard"),
        makeMessage("BLINK"),                               // unknown, dropped
        makeMessage("RESET"),
        makeMessage("SET_PATTERN", "patternId", "grayscale"),
    };

    Rtos::SleepMs(200);
    for (const msg::RemoteMessage& m : script) {
        if (!remoteInboxQueue.send(m, 100)) {
            std::cerr << "[TRANSPORT] INBOX FULL, DROP type=" << m.type << "\n";
        } else {
            std::cout << "[TRANSPORT] SENT type=" << m.type << "\n";
        }
        Rtos::SleepMs(150);
    }
}

int main(int argc, char** argv) {
    const std::string image_path = (argc > 1) ? argv[1] : "";
    const std::string out_dir    = (argc > 2) ? argv[2] : "tools/data/tmp/preview";

    std::cout << "=== HMD CALIBRATION PREVIEW ===\n";

    // ---- CONFIGURATION ----
    preview::PreviewTaskConfig preview_cfg{};
    preview_cfg.canvas_width  = 960;
    preview_cfg.canvas_height = 540;
    preview_cfg.tick_hz       = 60;

    platform::PngSnapshotConfig png_cfg{};
    png_cfg.out_dir = out_dir;
    png_cfg.prefix  = "preview";
    png_cfg.every_n = 10;

    preview::RemoteAdapterConfig remote_cfg{};
    remote_cfg.poll_timeout_ms = 50;

    // ---- OBJECTS ----
    preview::ParameterStore store;
    platform::PngSnapshotSurface surface(png_cfg);
    platform::LocalPointerEvents pointer_events;

    preview::PreviewTask preview(store, &surface, preview_cfg);
    preview::RemoteCommandAdapter adapter(remoteCommandQueue, remote_cfg);
    preview::DragController drag(store, pointer_events);

    // ---- SOURCE ----
    if (!image_path.empty()) {
        platform::ImageSourceConfig src_cfg{};
        src_cfg.path = image_path;
        platform::OpenCvImageSource source(src_cfg);
        if (!preview.loadSource(source)) {
            std::cerr << "[MAIN] continuing with the synthetic pattern\n";
        }
    }

    // ---- TASKS ----
    preview::RemoteCommandAdapter::TaskCtx adapter_ctx{};
    adapter_ctx.self  = &adapter;
    adapter_ctx.inbox = &remoteInboxQueue;

    if (!RemoteAdapterTask.Create("RemoteAdapter", preview::RemoteCommandAdapter::TaskEntry, &adapter_ctx) ||
        !RemoteTransportTask.Create("RemoteTransport", RemoteTransport, nullptr)) {
        std::cerr << "[MAIN] task creation failed\n";
        return 1;
    }

    preview::PreviewTask::TaskCtx preview_ctx{};
    preview_ctx.self      = &preview;
    preview_ctx.remote_in = &remoteCommandQueue;
    preview_ctx.stats_out = &previewStatsQueue;
    preview_ctx.max_ticks = 180;                 // ~3 s at 60 Hz

    if (!PreviewRenderTask.Create("PreviewRender", preview::PreviewTask::TaskEntry, &preview_ctx)) {
        std::cerr << "[MAIN] render task creation failed\n";
        adapter.RequestStop();
        RemoteAdapterTask.Join();
        RemoteTransportTask.Join();
        return 1;
    }

    // ---- LOCAL INPUT (main thread) ----
    // Drag the handle from 50 % to 80 % and release it outside the widget.
    const uint32_t kPointer = 1;
    const float width = static_cast<float>(preview_cfg.canvas_width);

    Rtos::SleepMs(500);
    (void)drag.onPointerDown(kPointer, 0.5f * width, width);
    for (int i = 1; i <= 30; ++i) {
        (void)drag.onPointerMove(kPointer, (0.5f + 0.01f * static_cast<float>(i)) * width, width);
        Rtos::SleepMs(16);
    }
    (void)pointer_events.dispatch(platform::PointerEventKind::POINTER_UP, kPointer);

    // Local slider after the remote script: last writer wins
    Rtos::SleepMs(1200);
    (void)store.setGamma(2.4f);

    // ---- SHUTDOWN ----
    RemoteTransportTask.Join();
    adapter.RequestStop();
    RemoteAdapterTask.Join();
    PreviewRenderTask.Join();

    preview::PreviewStats last{};
    if (previewStatsQueue.try_receive(last)) {
        std::cout << "[MAIN] last tap: ticks=" << last.ticks << " frames=" << last.frames << "\n";
    }

    // ---- REPORT ----
    const msg::ReportSnapshot snap = store.exportSnapshot(msg::DeltaEPair{4.2f, 1.1f});
    std::cout << "[MAIN] params brightness=" << snap.params.brightness
              << " contrast=" << snap.params.contrast
              << " gamma=" << snap.params.gamma
              << " temp=" << snap.params.temperature_k << "K"
              << " pattern=" << msg::PatternIdStr(snap.pattern)
              << " boundary=" << snap.boundary_fraction << "\n";

    const report::GamutCoverage gamut = report::computeGamutCoverage(report::DisplayPrimaries{});
    for (uint8_t i = 0; i < report::STANDARD_GAMUT_COUNT; ++i) {
        const auto g = static_cast<report::StandardGamut>(i);
        std::cout << "[MAIN] gamut " << report::StandardGamutStr(g)
                  << " coverage=" << gamut.coverage(g) << "%\n";
    }

    const preview::PreviewStats st = preview.stats();
    std::cout << "[MAIN] ticks=" << st.ticks
              << " frames=" << st.frames
              << " transforms=" << st.full_transforms
              << " patterns=" << st.pattern_generations
              << " composes=" << st.full_composes
              << " boundary_updates=" << st.boundary_updates
              << " remote_applied=" << st.remote_applied
              << " remote_dropped=" << (adapter.droppedCount() + st.remote_rejected)
              << " snapshots=" << surface.writtenCount() << "\n";

    return 0;
}
