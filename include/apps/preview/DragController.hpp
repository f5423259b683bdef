#pragma once
#include <cstdint>

#include "apps/preview/ParameterStore.hpp"
#include "platform/IPointerEvents.hpp"

namespace preview {

// ---------------------------------------------------------------------------
// DragController: local pointer input for the split-view handle.
//
// onPointerDown() takes drag ownership in the store and registers global
// POINTER_UP and TOUCH_END listeners, so a release anywhere (also outside the
// preview widget) ends the drag. Listeners are released exactly once: on drag
// end, on onUnmount(), or in the destructor, whichever comes first.
// ---------------------------------------------------------------------------
class DragController {
public:
    DragController(ParameterStore& store, platform::IPointerEvents& events);
    ~DragController();

    DragController(const DragController&) = delete;
    DragController& operator=(const DragController&) = delete;

    // x_px is relative to the left edge of the preview, width_px its width.
    bool onPointerDown(uint32_t pointer_id, float x_px, float width_px);
    bool onPointerMove(uint32_t pointer_id, float x_px, float width_px);
    bool onPointerUp(uint32_t pointer_id);

    // Widget teardown mid-drag: ends the drag and drops the listeners.
    void onUnmount();

    bool     listening()  const { return m_listening; }
    uint32_t owner()      const { return m_owner; }
    uint32_t releaseCount() const { return m_releases; }

private:
    ParameterStore&            m_store;
    platform::IPointerEvents&  m_events;

    bool     m_listening = false;
    uint32_t m_owner = msg::NO_DRAG_OWNER;
    platform::ListenerId m_up_id    = platform::INVALID_LISTENER;
    platform::ListenerId m_touch_id = platform::INVALID_LISTENER;
    uint32_t m_releases = 0;

    static void GlobalPointerEnd(void* arg, uint32_t pointer_id);

    bool acquireListeners();
    void releaseListeners();
};

// Pointer x over widget width -> boundary fraction in [0,1].
// false if width_px <= 0 or either value is not finite.
bool pointerFraction(float x_px, float width_px, float& fraction);

} // namespace preview
