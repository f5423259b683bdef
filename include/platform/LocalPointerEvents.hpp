#pragma once
#include <cstdint>
#include <vector>

#include "os/rtos.hpp"
#include "platform/IPointerEvents.hpp"

namespace platform {

// In-process listener registry. The host's input layer (or a test) calls
// dispatch() for every pointer-up / touch-end it sees.
class LocalPointerEvents : public IPointerEvents {
public:
    ListenerId addGlobalListener(PointerEventKind kind, PointerEndFn fn, void* arg) override;
    bool removeGlobalListener(ListenerId id) override;

    // Invoke every listener registered for 'kind'. Listeners may remove
    // themselves (or others) from inside the callback.
    uint32_t dispatch(PointerEventKind kind, uint32_t pointer_id);

    std::size_t listenerCount() const;
    uint32_t totalAdded()   const;
    uint32_t totalRemoved() const;

private:
    struct Listener {
        ListenerId       id;
        PointerEventKind kind;
        PointerEndFn     fn;
        void*            arg;
    };

    mutable Rtos::Mutex m_lock;
    std::vector<Listener> m_listeners;
    ListenerId m_next_id = 1;
    uint32_t   m_added = 0;
    uint32_t   m_removed = 0;
};

} // namespace platform
