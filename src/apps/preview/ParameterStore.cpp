// ParameterStore.cpp
#include "apps/preview/ParameterStore.hpp"

#include <cmath>
#include <iostream>

namespace {

static inline int32_t clampInt(int64_t v, int32_t lo, int32_t hi) {
    return static_cast<int32_t>((v < lo) ? lo : (v > hi) ? hi : v);
}

static inline float clampf(float x, float lo, float hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

} // anonymous namespace

namespace preview {

const char* ParameterStore::StatusStr(Status s) {
    switch (s) {
        case Status::OK:             return "OK";
        case Status::INVALID_INPUT:  return "INVALID_INPUT";
        case Status::DRAG_BUSY:      return "DRAG_BUSY";
        case Status::NOT_DRAG_OWNER: return "NOT_DRAG_OWNER";
        default:                     return "UNKNOWN";
    }
}

ParameterStore::Snapshot ParameterStore::snapshot() const {
    Rtos::LockGuard lk(m_lock);
    Snapshot s;
    s.pattern     = m_pattern;
    s.params      = m_params;
    s.split       = m_split;
    s.pattern_rev = m_pattern_rev;
    s.params_rev  = m_params_rev;
    s.split_rev   = m_split_rev;
    return s;
}

msg::TransformParameters ParameterStore::params() const {
    Rtos::LockGuard lk(m_lock);
    return m_params;
}

// ==============================================
// Pattern
// ==============================================

ParameterStore::Status ParameterStore::setPattern(msg::PatternKind kind) {
    Rtos::LockGuard lk(m_lock);

    switch (kind) {
        case msg::PatternKind::GRAYSCALE:     m_pattern = msg::PatternSpec::Grayscale();    break;
        case msg::PatternKind::COLOR_CHECKER: m_pattern = msg::PatternSpec::ColorChecker(); break;
        case msg::PatternKind::CHECKERBOARD:  m_pattern = msg::PatternSpec::Checkerboard(); break;
        default:
            std::cerr << "[STORE] REJECT pattern kind=" << static_cast<int>(kind) << "\n";
            return finishLocked(Status::INVALID_INPUT);
    }
    ++m_pattern_rev;
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::setPattern(const char* pattern_id) {
    msg::PatternKind kind;
    if (!msg::PatternKindFromId(pattern_id, kind)) {
        std::cerr << "[STORE] REJECT pattern id=" << (pattern_id ? pattern_id : "(null)") << "\n";
        Rtos::LockGuard lk(m_lock);
        return finishLocked(Status::INVALID_INPUT);
    }
    return setPattern(kind);
}

// ==============================================
// Transform parameters
// ==============================================

ParameterStore::Status ParameterStore::adjustBrightness(int32_t delta) {
    Rtos::LockGuard lk(m_lock);
    msg::TransformParameters p = m_params;
    p.brightness = clampInt(int64_t(p.brightness) + delta, msg::BRIGHTNESS_MIN, msg::BRIGHTNESS_MAX);
    setParamsLocked(p);
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::adjustContrast(int32_t delta) {
    Rtos::LockGuard lk(m_lock);
    msg::TransformParameters p = m_params;
    p.contrast = clampInt(int64_t(p.contrast) + delta, msg::CONTRAST_MIN, msg::CONTRAST_MAX);
    setParamsLocked(p);
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::setBrightness(int32_t value) {
    Rtos::LockGuard lk(m_lock);
    msg::TransformParameters p = m_params;
    p.brightness = clampInt(value, msg::BRIGHTNESS_MIN, msg::BRIGHTNESS_MAX);
    setParamsLocked(p);
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::setContrast(int32_t value) {
    Rtos::LockGuard lk(m_lock);
    msg::TransformParameters p = m_params;
    p.contrast = clampInt(value, msg::CONTRAST_MIN, msg::CONTRAST_MAX);
    setParamsLocked(p);
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::setGamma(float value) {
    Rtos::LockGuard lk(m_lock);

    // gamma is a divisor in the pipeline: never store <= 0
    if (!std::isfinite(value) || value <= 0.0f) {
        std::cerr << "[STORE] REJECT gamma=" << value
                  << " (keeping " << m_params.gamma << ")\n";
        return finishLocked(Status::INVALID_INPUT);
    }

    msg::TransformParameters p = m_params;
    p.gamma = clampf(value, msg::GAMMA_MIN, msg::GAMMA_MAX);
    setParamsLocked(p);
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::setTemperature(int32_t kelvin) {
    Rtos::LockGuard lk(m_lock);
    msg::TransformParameters p = m_params;
    p.temperature_k = clampInt(kelvin, msg::TEMPERATURE_MIN_K, msg::TEMPERATURE_MAX_K);
    setParamsLocked(p);
    return finishLocked(Status::OK);
}

// ==============================================
// Split view
// ==============================================

ParameterStore::Status ParameterStore::setBoundary(float fraction) {
    Rtos::LockGuard lk(m_lock);
    if (!std::isfinite(fraction)) {
        std::cerr << "[STORE] REJECT boundary=" << fraction << "\n";
        return finishLocked(Status::INVALID_INPUT);
    }
    setBoundaryLocked(fraction);
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::beginDrag(uint32_t owner) {
    Rtos::LockGuard lk(m_lock);

    if (owner == msg::NO_DRAG_OWNER) return finishLocked(Status::INVALID_INPUT);

    if (m_split.dragging) {
        return finishLocked(m_split.drag_owner == owner ? Status::OK : Status::DRAG_BUSY);
    }

    m_split.dragging   = true;
    m_split.drag_owner = owner;
    ++m_split_rev;
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::dragTo(uint32_t owner, float fraction) {
    Rtos::LockGuard lk(m_lock);

    if (!m_split.dragging || m_split.drag_owner != owner) {
        return finishLocked(Status::NOT_DRAG_OWNER);
    }
    if (!std::isfinite(fraction)) return finishLocked(Status::INVALID_INPUT);

    setBoundaryLocked(fraction);
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::endDrag(uint32_t owner) {
    Rtos::LockGuard lk(m_lock);

    if (!m_split.dragging || m_split.drag_owner != owner) {
        return finishLocked(Status::NOT_DRAG_OWNER);
    }

    m_split.dragging   = false;
    m_split.drag_owner = msg::NO_DRAG_OWNER;
    ++m_split_rev;
    return finishLocked(Status::OK);
}

// ==============================================
// Reset / recommendation / report
// ==============================================

ParameterStore::Status ParameterStore::reset() {
    Rtos::LockGuard lk(m_lock);
    resetLocked();
    return finishLocked(Status::OK);
}

ParameterStore::Status ParameterStore::applyRecommendation(const msg::Recommendation& rec) {
    Rtos::LockGuard lk(m_lock);

    if (!std::isfinite(rec.gamma) || rec.gamma <= 0.0f) {
        std::cerr << "[STORE] REJECT recommendation gamma=" << rec.gamma << "\n";
        return finishLocked(Status::INVALID_INPUT);
    }

    msg::TransformParameters p;
    p.gamma         = clampf(rec.gamma, msg::GAMMA_MIN, msg::GAMMA_MAX);
    p.temperature_k = clampInt(rec.color_temperature_k, msg::TEMPERATURE_MIN_K, msg::TEMPERATURE_MAX_K);
    p.brightness    = msg::RECOMMENDED_BRIGHTNESS;
    p.contrast      = msg::RECOMMENDED_CONTRAST;
    setParamsLocked(p);

    std::cout << "[STORE] RECOMMENDATION APPLIED gamma=" << p.gamma
              << " temp=" << p.temperature_k << "K\n";
    return finishLocked(Status::OK);
}

msg::ReportSnapshot ParameterStore::exportSnapshot(const msg::DeltaEPair& accuracy) const {
    Rtos::LockGuard lk(m_lock);
    msg::ReportSnapshot r;
    r.params            = m_params;
    r.pattern           = m_pattern.kind;
    r.boundary_fraction = m_split.boundary_fraction;
    r.accuracy          = accuracy;
    r.params_revision   = m_params_rev;
    r.t_us              = Rtos::NowUs();
    return r;
}

// ==============================================
// Remote commands
// ==============================================

ParameterStore::Status ParameterStore::apply(const msg::RemoteCommand& cmd) {
    Status s = Status::INVALID_INPUT;

    switch (cmd.type) {
        case msg::RemoteCommandType::SET_PATTERN:       s = setPattern(cmd.pattern);        break;
        case msg::RemoteCommandType::ADJUST_BRIGHTNESS: s = adjustBrightness(cmd.delta);    break;
        case msg::RemoteCommandType::ADJUST_CONTRAST:   s = adjustContrast(cmd.delta);      break;
        case msg::RemoteCommandType::RESET:             s = reset();                        break;
        default: {
            std::cerr << "[STORE] DROP remote seq=" << cmd.seq
                      << " unknown type=" << static_cast<int>(cmd.type) << "\n";
            Rtos::LockGuard lk(m_lock);
            return finishLocked(Status::INVALID_INPUT);
        }
    }

    if (s == Status::OK) {
        std::cout << "[STORE] APPLY remote seq=" << cmd.seq
                  << " " << msg::RemoteCommandTypeStr(cmd.type) << "\n";
    } else {
        std::cerr << "[STORE] DROP remote seq=" << cmd.seq
                  << " " << msg::RemoteCommandTypeStr(cmd.type)
                  << " status=" << StatusStr(s) << "\n";
    }
    return s;
}

uint32_t ParameterStore::drain(RemoteCommandQueue& queue, uint32_t* rejected) {
    uint32_t n = 0;
    uint32_t bad = 0;
    msg::RemoteCommand cmd{};
    while (queue.try_receive(cmd)) {
        if (apply(cmd) != Status::OK) ++bad;   // logged by apply()
        ++n;
    }
    if (rejected) *rejected = bad;
    return n;
}

ParameterStore::Status ParameterStore::lastStatus() const {
    Rtos::LockGuard lk(m_lock);
    return m_status;
}

// -------------------- private helpers --------------------

void ParameterStore::setParamsLocked(const msg::TransformParameters& p) {
    if (p != m_params) {
        m_params = p;
        ++m_params_rev;
    }
}

void ParameterStore::setBoundaryLocked(float fraction) {
    const float f = clampf(fraction, 0.0f, 1.0f);
    if (f != m_split.boundary_fraction) {
        m_split.boundary_fraction = f;
        ++m_split_rev;
    }
}

void ParameterStore::resetLocked() {
    setParamsLocked(msg::TransformParameters{});

    m_pattern = msg::PatternSpec::Grayscale();
    ++m_pattern_rev;

    const bool was_dragging = m_split.dragging;
    m_split.dragging   = false;
    m_split.drag_owner = msg::NO_DRAG_OWNER;
    if (was_dragging) ++m_split_rev;
    setBoundaryLocked(msg::BOUNDARY_DEFAULT);
}

ParameterStore::Status ParameterStore::finishLocked(Status s) {
    m_status = s;
    return s;
}

} // namespace preview
