#pragma once
#include <cstdint>

namespace msg {

static constexpr float  BOUNDARY_DEFAULT = 0.5f;
static constexpr uint32_t NO_DRAG_OWNER  = 0;

struct SplitState {
    float    boundary_fraction = BOUNDARY_DEFAULT; // 0..1, share of width showing the original
    bool     dragging          = false;
    uint32_t drag_owner        = NO_DRAG_OWNER;    // pointer/touch id owning the drag
};

} // namespace msg
