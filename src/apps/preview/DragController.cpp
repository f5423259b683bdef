// DragController.cpp
#include "apps/preview/DragController.hpp"

#include <cmath>
#include <iostream>

namespace preview {

bool pointerFraction(float x_px, float width_px, float& fraction) {
    if (!std::isfinite(x_px) || !std::isfinite(width_px) || width_px <= 0.0f) return false;

    float f = x_px / width_px;
    if (f < 0.0f) f = 0.0f;
    if (f > 1.0f) f = 1.0f;
    fraction = f;
    return true;
}

DragController::DragController(ParameterStore& store, platform::IPointerEvents& events)
: m_store(store)
, m_events(events) {}

DragController::~DragController() {
    onUnmount();
}

bool DragController::onPointerDown(uint32_t pointer_id, float x_px, float width_px) {
    float f = 0.0f;
    if (!pointerFraction(x_px, width_px, f)) {
        std::cerr << "[DRAG] ignoring pointer-down x=" << x_px << " width=" << width_px << "\n";
        return false;
    }

    const ParameterStore::Status s = m_store.beginDrag(pointer_id);
    if (s != ParameterStore::Status::OK) {
        std::cerr << "[DRAG] begin refused pointer=" << pointer_id
                  << " status=" << ParameterStore::StatusStr(s) << "\n";
        return false;
    }

    m_owner = pointer_id;
    if (!m_listening && !acquireListeners()) {
        // Without a global release path the drag could never end
        (void)m_store.endDrag(pointer_id);
        m_owner = msg::NO_DRAG_OWNER;
        return false;
    }

    return m_store.dragTo(pointer_id, f) == ParameterStore::Status::OK;
}

bool DragController::onPointerMove(uint32_t pointer_id, float x_px, float width_px) {
    if (pointer_id != m_owner || m_owner == msg::NO_DRAG_OWNER) return false;

    float f = 0.0f;
    if (!pointerFraction(x_px, width_px, f)) return false;

    return m_store.dragTo(pointer_id, f) == ParameterStore::Status::OK;
}

bool DragController::onPointerUp(uint32_t pointer_id) {
    if (m_owner == msg::NO_DRAG_OWNER || pointer_id != m_owner) return false;

    const ParameterStore::Status s = m_store.endDrag(pointer_id);
    m_owner = msg::NO_DRAG_OWNER;
    releaseListeners();

    if (s != ParameterStore::Status::OK) {
        // A reset cleared the drag in the meantime
        std::cout << "[DRAG] end pointer=" << pointer_id
                  << " store=" << ParameterStore::StatusStr(s) << "\n";
    }
    return true;
}

void DragController::onUnmount() {
    if (m_owner != msg::NO_DRAG_OWNER) {
        (void)m_store.endDrag(m_owner);
        m_owner = msg::NO_DRAG_OWNER;
    }
    releaseListeners();
}

// -------------------- private helpers --------------------

void DragController::GlobalPointerEnd(void* arg, uint32_t pointer_id) {
    auto* self = static_cast<DragController*>(arg);
    if (!self) return;
    (void)self->onPointerUp(pointer_id);
}

bool DragController::acquireListeners() {
    m_up_id = m_events.addGlobalListener(platform::PointerEventKind::POINTER_UP,
                                         &DragController::GlobalPointerEnd, this);
    m_touch_id = m_events.addGlobalListener(platform::PointerEventKind::TOUCH_END,
                                            &DragController::GlobalPointerEnd, this);

    if (m_up_id == platform::INVALID_LISTENER || m_touch_id == platform::INVALID_LISTENER) {
        std::cerr << "[DRAG] global listener registration failed\n";
        if (m_up_id != platform::INVALID_LISTENER) (void)m_events.removeGlobalListener(m_up_id);
        if (m_touch_id != platform::INVALID_LISTENER) (void)m_events.removeGlobalListener(m_touch_id);
        m_up_id = m_touch_id = platform::INVALID_LISTENER;
        return false;
    }

    m_listening = true;
    return true;
}

void DragController::releaseListeners() {
    if (!m_listening) return;
    m_listening = false;

    if (!m_events.removeGlobalListener(m_up_id)) {
        std::cerr << "[DRAG] pointer-up listener " << m_up_id << " already gone\n";
    }
    if (!m_events.removeGlobalListener(m_touch_id)) {
        std::cerr << "[DRAG] touch-end listener " << m_touch_id << " already gone\n";
    }
    m_up_id = m_touch_id = platform::INVALID_LISTENER;
    ++m_releases;
}

} // namespace preview
