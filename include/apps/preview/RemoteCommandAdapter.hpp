#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "os/rtos.hpp"
#include "msg/RemoteCommand.hpp"
#include "apps/preview/ParameterStore.hpp"   // for RemoteCommandQueue

namespace preview {

// Records handed over by the transport thread
static constexpr std::size_t REMOTE_INBOX_CAP = 16;
using RemoteInboxQueue = Rtos::Queue<msg::RemoteMessage, REMOTE_INBOX_CAP>;

struct RemoteAdapterConfig {
    // Inbox poll period for the task loop; bounds stop latency.
    uint32_t poll_timeout_ms = 100;
};

// ---------------------------------------------------------------------------
// RemoteCommandAdapter: validates remote-control records and forwards typed
// commands to the store's queue. Never touches ParameterStore directly; the
// render tick drains the queue, so application is atomic w.r.t. snapshots.
//
// Malformed records (unknown type, missing field, a value that is not an
// integer or does not fit in 64 bits) are dropped with a warning. Any
// representable delta is forwarded, saturated to int32; the store clamps the
// result into range. Queue overflow drops the command (delivery is
// at-most-once). Duplicates are forwarded as-is.
// ---------------------------------------------------------------------------
class RemoteCommandAdapter {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        RemoteCommandAdapter* self  = nullptr;
        RemoteInboxQueue*     inbox = nullptr;   // transport -> adapter
    };

    enum class Status : uint8_t {
        OK = 0,
        UNKNOWN_TYPE,
        MISSING_FIELD,
        BAD_VALUE,
        QUEUE_FULL,
    };
    static const char* StatusStr(Status s);

public:
    explicit RemoteCommandAdapter(RemoteCommandQueue& out, const RemoteAdapterConfig& cfg = {});

    // Record dispatcher: routes on msg.type to one of the entry points below.
    bool onMessage(const msg::RemoteMessage& m);

    // One inbound entry point per message type
    bool onSetPattern(const std::string& pattern_id);
    bool onAdjustBrightness(int64_t value);
    bool onAdjustContrast(int64_t value);
    bool onReset();

    // OSAL-compatible entry point: drains ctx->inbox until RequestStop().
    static void TaskEntry(void* arg);

    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    uint32_t acceptedCount() const { return m_accepted.load(); }
    uint32_t droppedCount()  const { return m_dropped.load(); }
    Status   lastStatus()    const { return m_status.load(); }

private:
    RemoteCommandQueue& m_out;
    RemoteAdapterConfig m_cfg{};

    std::atomic<bool>     m_stop_requested{false};
    std::atomic<uint32_t> m_seq{0};
    std::atomic<uint32_t> m_accepted{0};
    std::atomic<uint32_t> m_dropped{0};
    std::atomic<Status>   m_status{Status::OK};

    void Run(RemoteInboxQueue& inbox);

    bool adjust(msg::RemoteCommandType type, int64_t value);
    bool forward(msg::RemoteCommand cmd);
    bool drop(Status s, const std::string& type, const char* detail);
};

// Strict integer parse of a record field ("-5", "+5", "12"). No leading
// whitespace, no fractions, no trailing garbage, must fit in int64.
bool parseDelta(const std::string& text, int64_t& out);

} // namespace preview
