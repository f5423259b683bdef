// test/preview_parameterstore_test.cpp
//
// ParameterStore: clamping, gamma rejection, reset idempotence, last writer
// wins across remote and local input, drag ownership, revisions, and
// concurrent writers against one reader.
#include <cmath>
#include <iostream>
#include <limits>

#include "os/rtos.hpp"
#include "apps/preview/ParameterStore.hpp"

static int g_failures = 0;

static void check(bool ok, const char* what) {
    if (ok) {
        std::cout << "[TEST] PASS: " << what << "\n";
    } else {
        std::cerr << "[TEST] FAIL: " << what << "\n";
        ++g_failures;
    }
}

using Status = preview::ParameterStore::Status;

static bool isDefault(const preview::ParameterStore::Snapshot& s) {
    return s.params == msg::TransformParameters{} &&
           s.pattern == msg::PatternSpec::Grayscale() &&
           s.split.boundary_fraction == msg::BOUNDARY_DEFAULT &&
           !s.split.dragging && s.split.drag_owner == msg::NO_DRAG_OWNER;
}

static msg::RemoteCommand remote(msg::RemoteCommandType t, int32_t delta = 0,
                                 msg::PatternKind k = msg::PatternKind::GRAYSCALE) {
    msg::RemoteCommand c{};
    c.type = t;
    c.delta = delta;
    c.pattern = k;
    return c;
}

// ---- Concurrency fixture ----
struct WriterCtx {
    preview::ParameterStore* store = nullptr;
    int sign = 1;
};

static void Writer(void* arg) {
    auto* ctx = static_cast<WriterCtx*>(arg);
    for (int i = 0; i < 2000; ++i) {
        (void)ctx->store->adjustBrightness(ctx->sign);
        (void)ctx->store->setGamma((i % 2) ? 1.5f : 2.5f);
    }
}

int main() {
    std::cout << "=== PARAMETER STORE TEST ===\n";

    // ---- Defaults ----
    {
        preview::ParameterStore store;
        check(isDefault(store.snapshot()), "fresh store holds the defaults");
    }

    // ---- Clamping ----
    {
        preview::ParameterStore store;
        check(store.adjustBrightness(500) == Status::OK && store.params().brightness == 200, "brightness clamps at 200");
        check(store.adjustBrightness(-900) == Status::OK && store.params().brightness == 0, "brightness clamps at 0");
        check(store.setContrast(-3) == Status::OK && store.params().contrast == 0, "contrast clamps at 0");
        check(store.adjustContrast(250) == Status::OK && store.params().contrast == 200, "contrast clamps at 200");
        check(store.setTemperature(20000) == Status::OK && store.params().temperature_k == 10000, "temperature clamps at 10000");
        check(store.setTemperature(1000) == Status::OK && store.params().temperature_k == 3000, "temperature clamps at 3000");
        check(store.setGamma(0.4f) == Status::OK && store.params().gamma == msg::GAMMA_MIN, "small positive gamma clamps to 1.0");
        check(store.setGamma(7.0f) == Status::OK && store.params().gamma == msg::GAMMA_MAX, "large gamma clamps to 3.0");
        check(store.setBoundary(1.7f) == Status::OK && store.snapshot().split.boundary_fraction == 1.0f, "boundary clamps at 1");
        check(store.setBoundary(-0.2f) == Status::OK && store.snapshot().split.boundary_fraction == 0.0f, "boundary clamps at 0");
    }

    // ---- Gamma rejection ----
    {
        preview::ParameterStore store;
        (void)store.setGamma(2.4f);
        const uint64_t rev = store.snapshot().params_rev;

        check(store.setGamma(0.0f) == Status::INVALID_INPUT, "gamma 0 rejected");
        check(store.setGamma(-1.0f) == Status::INVALID_INPUT, "negative gamma rejected");
        check(store.setGamma(std::numeric_limits<float>::quiet_NaN()) == Status::INVALID_INPUT, "NaN gamma rejected");
        check(store.params().gamma == 2.4f, "previous gamma kept");
        check(store.snapshot().params_rev == rev, "rejected writes do not bump the revision");
        check(store.lastStatus() == Status::INVALID_INPUT, "lastStatus reports the rejection");
        check(store.setBoundary(std::numeric_limits<float>::infinity()) == Status::INVALID_INPUT, "infinite boundary rejected");
    }

    // ---- Reset ----
    {
        preview::ParameterStore store;
        (void)store.setBrightness(30);
        (void)store.setContrast(170);
        (void)store.setGamma(1.3f);
        (void)store.setTemperature(9100);
        (void)store.setPattern(msg::PatternKind::CHECKERBOARD);
        (void)store.setBoundary(0.8f);
        (void)store.beginDrag(4);

        check(store.reset() == Status::OK && isDefault(store.snapshot()), "reset restores all defaults");
        const preview::ParameterStore::Snapshot once = store.snapshot();
        check(store.reset() == Status::OK && isDefault(store.snapshot()), "second reset is a no-op on values");
        check(store.snapshot().params_rev == once.params_rev && store.snapshot().split_rev == once.split_rev,
              "second reset changes no params or split revision");
    }

    // ---- Last writer wins ----
    {
        preview::ParameterStore store;
        preview::RemoteCommandQueue q;
        check(q.try_send(remote(msg::RemoteCommandType::ADJUST_BRIGHTNESS, -5)), "queue remote -5");
        check(store.drain(q) == 1 && store.params().brightness == 95, "remote delta applied");
        check(store.setBrightness(100) == Status::OK && store.params().brightness == 100,
              "local setBrightness(100) after remote -5 -> 100");
    }
    {
        preview::ParameterStore store;
        preview::RemoteCommandQueue q;
        (void)q.try_send(remote(msg::RemoteCommandType::SET_PATTERN, 0, msg::PatternKind::COLOR_CHECKER));
        (void)q.try_send(remote(msg::RemoteCommandType::ADJUST_CONTRAST, 5));
        (void)q.try_send(remote(msg::RemoteCommandType::ADJUST_CONTRAST, 5));   // duplicate: applied as-is
        (void)q.try_send(remote(msg::RemoteCommandType::SET_PATTERN, 0, msg::PatternKind::CHECKERBOARD));
        (void)q.try_send(remote(static_cast<msg::RemoteCommandType>(42)));

        uint32_t rejected = 0;
        check(store.drain(q, &rejected) == 5, "drain empties the queue");
        check(rejected == 1, "malformed command rejected");
        check(store.params().contrast == 110, "duplicate deltas both applied");
        check(store.snapshot().pattern.kind == msg::PatternKind::CHECKERBOARD, "later pattern wins");
    }
    {
        preview::ParameterStore store;
        check(store.setPattern("colorchecker") == Status::OK, "pattern by wire id");
        check(store.setPattern("plaid") == Status::INVALID_INPUT, "unknown wire id rejected");
        check(store.setPattern(static_cast<const char*>(nullptr)) == Status::INVALID_INPUT, "null id rejected");
        check(store.snapshot().pattern.kind == msg::PatternKind::COLOR_CHECKER, "rejected ids leave pattern alone");
    }

    // ---- Revisions ----
    {
        preview::ParameterStore store;
        const preview::ParameterStore::Snapshot s0 = store.snapshot();

        (void)store.setBrightness(100);   // unchanged value
        check(store.snapshot().params_rev == s0.params_rev, "no-op write keeps params_rev");

        (void)store.setBrightness(101);
        check(store.snapshot().params_rev == s0.params_rev + 1, "changed value bumps params_rev");
        check(store.snapshot().split_rev == s0.split_rev, "params change leaves split_rev");

        (void)store.setPattern(msg::PatternKind::GRAYSCALE);
        check(store.snapshot().pattern_rev == s0.pattern_rev + 1, "every pattern selection bumps pattern_rev");

        (void)store.setBoundary(0.25f);
        check(store.snapshot().split_rev == s0.split_rev + 1, "boundary change bumps split_rev");
        check(store.snapshot().params_rev == s0.params_rev + 1, "boundary change leaves params_rev");
    }

    // ---- Drag ownership ----
    {
        preview::ParameterStore store;
        check(store.beginDrag(msg::NO_DRAG_OWNER) == Status::INVALID_INPUT, "owner 0 refused");
        check(store.beginDrag(7) == Status::OK && store.snapshot().split.dragging, "pointer 7 takes the drag");
        check(store.beginDrag(7) == Status::OK, "re-entry by the owner is fine");
        check(store.beginDrag(8) == Status::DRAG_BUSY, "second pointer refused while dragging");
        check(store.dragTo(8, 0.9f) == Status::NOT_DRAG_OWNER, "non-owner cannot move the boundary");
        check(store.dragTo(7, 0.75f) == Status::OK && store.snapshot().split.boundary_fraction == 0.75f, "owner moves the boundary");
        check(store.endDrag(8) == Status::NOT_DRAG_OWNER && store.snapshot().split.dragging, "non-owner cannot end the drag");
        check(store.endDrag(7) == Status::OK && !store.snapshot().split.dragging, "owner ends the drag");
        check(store.dragTo(7, 0.1f) == Status::NOT_DRAG_OWNER, "no moves after the drag ended");
        check(store.beginDrag(8) == Status::OK, "next pointer can start a drag");
    }

    // ---- Recommendation / report ----
    {
        preview::ParameterStore store;
        msg::Recommendation rec{};
        rec.color_temperature_k = 6800;
        rec.gamma = 2.4f;
        rec.description = "Adjusted for ambient lighting";

        check(store.applyRecommendation(rec) == Status::OK, "recommendation applied");
        const msg::TransformParameters p = store.params();
        check(p.gamma == 2.4f && p.temperature_k == 6800, "gamma and temperature from the record");
        check(p.brightness == msg::RECOMMENDED_BRIGHTNESS && p.contrast == msg::RECOMMENDED_CONTRAST,
              "brightness 95 / contrast 110 preset");

        msg::Recommendation bad = rec;
        bad.gamma = 0.0f;
        bad.color_temperature_k = 9000;
        check(store.applyRecommendation(bad) == Status::INVALID_INPUT, "record with gamma 0 rejected");
        check(store.params() == p, "rejected record changes nothing");

        (void)store.setBoundary(0.3f);
        const msg::ReportSnapshot r = store.exportSnapshot(msg::DeltaEPair{4.5f, 1.2f});
        check(r.params == p && r.boundary_fraction == 0.3f, "report carries params and boundary");
        check(r.accuracy.before == 4.5f && r.accuracy.after == 1.2f, "report carries the caller's Delta-E pair");
        check(r.pattern == msg::PatternKind::GRAYSCALE, "report carries the pattern");
    }

    // ---- Concurrent writers, consistent reader ----
    {
        preview::ParameterStore store;
        WriterCtx up{&store, +1};
        WriterCtx down{&store, -1};

        Rtos::Task a;
        Rtos::Task b;
        check(a.Create("WriterUp", Writer, &up) && b.Create("WriterDown", Writer, &down), "writer tasks created");

        bool consistent = true;
        for (int i = 0; i < 2000; ++i) {
            const preview::ParameterStore::Snapshot s = store.snapshot();
            if (s.params.brightness < msg::BRIGHTNESS_MIN || s.params.brightness > msg::BRIGHTNESS_MAX) consistent = false;
            if (s.params.gamma != 1.5f && s.params.gamma != 2.5f && s.params.gamma != msg::GAMMA_DEFAULT) consistent = false;
        }
        a.Join();
        b.Join();
        check(consistent, "reader only ever sees whole, in-range values");

        const int br = store.params().brightness;
        check(br >= msg::BRIGHTNESS_MIN && br <= msg::BRIGHTNESS_MAX, "final brightness in range");
    }

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] all store checks passed\n";
    return 0;
}
