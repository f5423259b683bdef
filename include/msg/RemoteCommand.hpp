#pragma once
#include <cstdint>
#include <map>
#include <string>

#include "msg/PatternSpec.hpp"

namespace msg {

enum class RemoteCommandType : uint8_t {
    SET_PATTERN       = 0,
    ADJUST_BRIGHTNESS = 1,
    ADJUST_CONTRAST   = 2,
    RESET             = 3,
};

// Validated, typed command as queued for ParameterStore.
// Only the field matching 'type' is meaningful.
struct RemoteCommand {
    RemoteCommandType type = RemoteCommandType::RESET;
    PatternKind pattern    = PatternKind::GRAYSCALE; // SET_PATTERN
    int32_t     delta      = 0;                      // ADJUST_*
    uint32_t    seq        = 0;                      // adapter arrival counter (logging only)
};

// Record as delivered by the remote-control transport, before validation:
//   { type: "SET_PATTERN",       patternId: "colorchecker" }
//   { type: "ADJUST_BRIGHTNESS", value: "-5" }
//   { type: "ADJUST_CONTRAST",   value: "5" }
//   { type: "RESET" }
// Field values arrive as text; the adapter parses and range-checks them.
struct RemoteMessage {
    std::string type;
    std::map<std::string, std::string> fields;
};

// Wire names ("SET_PATTERN", ...)
const char* RemoteCommandTypeStr(RemoteCommandType t);
bool RemoteCommandTypeFromStr(const std::string& s, RemoteCommandType& out);

} // namespace msg
