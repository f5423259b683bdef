// LocalPointerEvents.cpp
#include "platform/LocalPointerEvents.hpp"

#include <algorithm>

namespace platform {

ListenerId LocalPointerEvents::addGlobalListener(PointerEventKind kind, PointerEndFn fn, void* arg) {
    if (!fn) return INVALID_LISTENER;

    Rtos::LockGuard lk(m_lock);
    const ListenerId id = m_next_id++;
    m_listeners.push_back(Listener{id, kind, fn, arg});
    ++m_added;
    return id;
}

bool LocalPointerEvents::removeGlobalListener(ListenerId id) {
    Rtos::LockGuard lk(m_lock);
    const auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
                                 [id](const Listener& l) { return l.id == id; });
    if (it == m_listeners.end()) return false;
    m_listeners.erase(it);
    ++m_removed;
    return true;
}

uint32_t LocalPointerEvents::dispatch(PointerEventKind kind, uint32_t pointer_id) {
    // Snapshot so callbacks can (un)register without holding the lock
    std::vector<Listener> targets;
    {
        Rtos::LockGuard lk(m_lock);
        for (const Listener& l : m_listeners) {
            if (l.kind == kind) targets.push_back(l);
        }
    }

    uint32_t called = 0;
    for (const Listener& l : targets) {
        bool still_registered = false;
        {
            Rtos::LockGuard lk(m_lock);
            still_registered = std::any_of(m_listeners.begin(), m_listeners.end(),
                                           [&l](const Listener& x) { return x.id == l.id; });
        }
        if (!still_registered) continue;
        l.fn(l.arg, pointer_id);
        ++called;
    }
    return called;
}

std::size_t LocalPointerEvents::listenerCount() const {
    Rtos::LockGuard lk(m_lock);
    return m_listeners.size();
}

uint32_t LocalPointerEvents::totalAdded() const {
    Rtos::LockGuard lk(m_lock);
    return m_added;
}

uint32_t LocalPointerEvents::totalRemoved() const {
    Rtos::LockGuard lk(m_lock);
    return m_removed;
}

} // namespace platform
