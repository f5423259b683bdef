#pragma once
#include <cstdint>

namespace msg {

enum class PatternKind : uint8_t {
    GRAYSCALE    = 0,
    COLOR_CHECKER = 1,
    CHECKERBOARD = 2,
};

static constexpr uint32_t GRAYSCALE_STEPS    = 256;
static constexpr uint32_t CHECKERBOARD_CELL  = 40;   // cell edge [px]

static constexpr uint32_t CHECKER_COLS       = 6;
static constexpr uint32_t CHECKER_ROWS       = 4;
static constexpr uint32_t CHECKER_SWATCHES   = CHECKER_COLS * CHECKER_ROWS;

// Tagged pattern selection. Only the field matching 'kind' is meaningful.
struct PatternSpec {
    PatternKind kind = PatternKind::GRAYSCALE;

    uint32_t steps     = GRAYSCALE_STEPS;    // GRAYSCALE
    uint32_t cell_size = CHECKERBOARD_CELL;  // CHECKERBOARD

    static PatternSpec Grayscale(uint32_t steps = GRAYSCALE_STEPS) {
        PatternSpec p;
        p.kind = PatternKind::GRAYSCALE;
        p.steps = steps;
        return p;
    }
    static PatternSpec ColorChecker() {
        PatternSpec p;
        p.kind = PatternKind::COLOR_CHECKER;
        return p;
    }
    static PatternSpec Checkerboard(uint32_t cell = CHECKERBOARD_CELL) {
        PatternSpec p;
        p.kind = PatternKind::CHECKERBOARD;
        p.cell_size = cell;
        return p;
    }
};

inline bool operator==(const PatternSpec& a, const PatternSpec& b) {
    return a.kind == b.kind && a.steps == b.steps && a.cell_size == b.cell_size;
}
inline bool operator!=(const PatternSpec& a, const PatternSpec& b) { return !(a == b); }

// Wire ids used by the remote control ("grayscale", "colorchecker", "checkerboard").
const char* PatternIdStr(PatternKind k);
bool PatternKindFromId(const char* id, PatternKind& out);

} // namespace msg
