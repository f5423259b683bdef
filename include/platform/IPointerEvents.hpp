#pragma once
#include <cstdint>

namespace platform {

// Drag-termination events delivered globally, i.e. also when the pointer is
// released outside the preview widget.
enum class PointerEventKind : uint8_t {
    POINTER_UP = 0,
    TOUCH_END  = 1,
};

using ListenerId = uint32_t;
static constexpr ListenerId INVALID_LISTENER = 0;

// Listener callback: (user arg, pointer/touch id)
using PointerEndFn = void (*)(void* arg, uint32_t pointer_id);

class IPointerEvents {
public:
    // Returns INVALID_LISTENER on failure.
    virtual ListenerId addGlobalListener(PointerEventKind kind, PointerEndFn fn, void* arg) = 0;
    virtual bool removeGlobalListener(ListenerId id) = 0;
    virtual ~IPointerEvents() = default;
};

} // namespace platform
