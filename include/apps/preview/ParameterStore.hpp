#pragma once
#include <cstdint>

#include "os/rtos.hpp"
#include "msg/PatternSpec.hpp"
#include "msg/TransformParams.hpp"
#include "msg/SplitState.hpp"
#include "msg/RemoteCommand.hpp"
#include "msg/ReportSnapshot.hpp"

namespace preview {

// ------------------------------
// Queue types (keep them explicit and boring)
// ------------------------------
static constexpr std::size_t REMOTE_Q_CAP = 32;
using RemoteCommandQueue = Rtos::Queue<msg::RemoteCommand, REMOTE_Q_CAP>; // adapter -> store

// ---------------------------------------------------------------------------
// ParameterStore: the single authoritative copy of pattern selection,
// transform parameters and split state.
//
// Two independent writers (local input, remote command queue) and one reader
// (render tick). Every mutation runs under one lock, so a snapshot is always
// either fully before or fully after any operation. Last writer wins by
// arrival order.
//
// Ranges: out-of-range values are clamped silently. gamma <= 0 (or not
// finite) is rejected: the previous value stays and INVALID_INPUT is
// returned.
//
// Revisions: each part carries a counter bumped only when its value changes
// (pattern_rev is bumped by every setPattern call, since a selection also
// switches the preview back to the pattern source). The render loop uses
// them as dirty flags.
// ---------------------------------------------------------------------------
class ParameterStore {
public:
    enum class Status : uint8_t {
        OK = 0,
        INVALID_INPUT,     // rejected value; store unchanged
        DRAG_BUSY,         // another pointer owns the drag
        NOT_DRAG_OWNER,    // drag update from a pointer that does not own it
    };
    static const char* StatusStr(Status s);

    struct Snapshot {
        msg::PatternSpec          pattern{};
        msg::TransformParameters  params{};
        msg::SplitState           split{};

        uint64_t pattern_rev = 0;
        uint64_t params_rev  = 0;
        uint64_t split_rev   = 0;
    };

    ParameterStore() = default;

    ParameterStore(const ParameterStore&) = delete;
    ParameterStore& operator=(const ParameterStore&) = delete;

    // Consistent copy of everything (render tick entry point).
    Snapshot snapshot() const;
    msg::TransformParameters params() const;

    // ---- Pattern ----
    Status setPattern(msg::PatternKind kind);
    Status setPattern(const char* pattern_id);      // wire id, e.g. "colorchecker"

    // ---- Transform parameters ----
    Status adjustBrightness(int32_t delta);
    Status adjustContrast(int32_t delta);
    Status setBrightness(int32_t value);
    Status setContrast(int32_t value);
    Status setGamma(float value);
    Status setTemperature(int32_t kelvin);

    // ---- Split view ----
    Status setBoundary(float fraction);
    Status beginDrag(uint32_t owner);
    Status dragTo(uint32_t owner, float fraction);
    Status endDrag(uint32_t owner);

    // Defaults: brightness 100, contrast 100, gamma 2.2, 6500 K, GRAYSCALE,
    // boundary 0.5, no drag.
    Status reset();

    // Gamma + temperature from the record, brightness 95 / contrast 110.
    // Rejected as a whole if the record's gamma is invalid.
    Status applyRecommendation(const msg::Recommendation& rec);

    // Read-only record for the report consumer.
    msg::ReportSnapshot exportSnapshot(const msg::DeltaEPair& accuracy) const;

    // ---- Remote commands ----
    Status apply(const msg::RemoteCommand& cmd);

    // Apply everything queued so far, in arrival order. Returns the number
    // of commands taken off the queue; 'rejected' (optional) counts those
    // the store refused.
    uint32_t drain(RemoteCommandQueue& queue, uint32_t* rejected = nullptr);

    Status lastStatus() const;

private:
    mutable Rtos::Mutex m_lock;

    msg::PatternSpec         m_pattern{};
    msg::TransformParameters m_params{};
    msg::SplitState          m_split{};

    uint64_t m_pattern_rev = 0;
    uint64_t m_params_rev  = 0;
    uint64_t m_split_rev   = 0;

    Status m_status = Status::OK;

    // Lock must be held by the caller for the *Locked helpers.
    void setParamsLocked(const msg::TransformParameters& p);
    void setBoundaryLocked(float fraction);
    void resetLocked();
    Status finishLocked(Status s);
};

} // namespace preview
