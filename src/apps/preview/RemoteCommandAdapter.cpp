// RemoteCommandAdapter.cpp
#include "apps/preview/RemoteCommandAdapter.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace preview {

static inline RemoteAdapterConfig sanitise(const RemoteAdapterConfig& in) {
    RemoteAdapterConfig cfg = in;
    if (cfg.poll_timeout_ms == 0) cfg.poll_timeout_ms = 1;
    if (cfg.poll_timeout_ms == Rtos::MAX_TIMEOUT) cfg.poll_timeout_ms = 1000; // must wake to see stop
    return cfg;
}

bool parseDelta(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    if (std::isspace(static_cast<unsigned char>(text[0]))) return false;

    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE) return false;
    if (end == text.c_str() || *end != '\0') return false;

    out = static_cast<int64_t>(v);
    return true;
}

const char* RemoteCommandAdapter::StatusStr(Status s) {
    switch (s) {
        case Status::OK:            return "OK";
        case Status::UNKNOWN_TYPE:  return "UNKNOWN_TYPE";
        case Status::MISSING_FIELD: return "MISSING_FIELD";
        case Status::BAD_VALUE:     return "BAD_VALUE";
        case Status::QUEUE_FULL:    return "QUEUE_FULL";
        default:                    return "UNKNOWN";
    }
}

RemoteCommandAdapter::RemoteCommandAdapter(RemoteCommandQueue& out, const RemoteAdapterConfig& cfg)
: m_out(out)
, m_cfg(sanitise(cfg)) {}

// ==============================================
// Inbound entry points
// ==============================================

bool RemoteCommandAdapter::onMessage(const msg::RemoteMessage& m) {
    msg::RemoteCommandType type;
    if (!msg::RemoteCommandTypeFromStr(m.type, type)) {
        return drop(Status::UNKNOWN_TYPE, m.type, "unrecognised type");
    }

    switch (type) {
        case msg::RemoteCommandType::SET_PATTERN: {
            const auto it = m.fields.find("patternId");
            if (it == m.fields.end()) return drop(Status::MISSING_FIELD, m.type, "patternId");
            return onSetPattern(it->second);
        }
        case msg::RemoteCommandType::ADJUST_BRIGHTNESS:
        case msg::RemoteCommandType::ADJUST_CONTRAST: {
            const auto it = m.fields.find("value");
            if (it == m.fields.end()) return drop(Status::MISSING_FIELD, m.type, "value");

            int64_t value = 0;
            if (!parseDelta(it->second, value)) {
                return drop(Status::BAD_VALUE, m.type, "value is not an integer");
            }
            return adjust(type, value);
        }
        case msg::RemoteCommandType::RESET:
            return onReset();
    }
    return drop(Status::UNKNOWN_TYPE, m.type, "unhandled type");
}

bool RemoteCommandAdapter::onSetPattern(const std::string& pattern_id) {
    msg::RemoteCommand cmd{};
    cmd.type = msg::RemoteCommandType::SET_PATTERN;
    if (!msg::PatternKindFromId(pattern_id.c_str(), cmd.pattern)) {
        return drop(Status::BAD_VALUE, "SET_PATTERN", "unknown patternId");
    }
    return forward(cmd);
}

bool RemoteCommandAdapter::onAdjustBrightness(int64_t value) {
    return adjust(msg::RemoteCommandType::ADJUST_BRIGHTNESS, value);
}

bool RemoteCommandAdapter::onAdjustContrast(int64_t value) {
    return adjust(msg::RemoteCommandType::ADJUST_CONTRAST, value);
}

bool RemoteCommandAdapter::onReset() {
    msg::RemoteCommand cmd{};
    cmd.type = msg::RemoteCommandType::RESET;
    return forward(cmd);
}

// ==============================================
// Task
// ==============================================

void RemoteCommandAdapter::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    if (!ctx || !ctx->self || !ctx->inbox) {
        std::cerr << "[REMOTE] TaskEntry: incomplete context\n";
        return;
    }
    ctx->self->Run(*ctx->inbox);
}

void RemoteCommandAdapter::Run(RemoteInboxQueue& inbox) {
    std::cout << "[REMOTE] adapter started\n";
    while (!StopRequested()) {
        msg::RemoteMessage m;
        if (!inbox.receive(m, m_cfg.poll_timeout_ms)) {
            continue;
        }
        (void)onMessage(m);   // drops are counted and logged
    }
    std::cout << "[REMOTE] adapter stopped\n";
}

// -------------------- private helpers --------------------

bool RemoteCommandAdapter::adjust(msg::RemoteCommandType type, int64_t value) {
    // Saturate; ParameterStore clamps the applied result into range
    constexpr int64_t lo = std::numeric_limits<int32_t>::min();
    constexpr int64_t hi = std::numeric_limits<int32_t>::max();

    msg::RemoteCommand cmd{};
    cmd.type  = type;
    cmd.delta = static_cast<int32_t>((value < lo) ? lo : (value > hi) ? hi : value);
    return forward(cmd);
}

bool RemoteCommandAdapter::forward(msg::RemoteCommand cmd) {
    cmd.seq = m_seq.fetch_add(1) + 1;

    // Never block the transport thread
    if (!m_out.try_send(cmd)) {
        return drop(Status::QUEUE_FULL, msg::RemoteCommandTypeStr(cmd.type), "store queue full");
    }

    m_accepted.fetch_add(1);
    m_status.store(Status::OK);
    return true;
}

bool RemoteCommandAdapter::drop(Status s, const std::string& type, const char* detail) {
    m_dropped.fetch_add(1);
    m_status.store(s);
    std::cerr << "[REMOTE] DROP type=" << (type.empty() ? "(none)" : type)
              << " reason=" << StatusStr(s) << " (" << detail << ")\n";
    return false;
}

} // namespace preview
