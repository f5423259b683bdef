// MsgNames.cpp
// Wire names for pattern ids and remote command types.
#include "msg/PatternSpec.hpp"
#include "msg/RemoteCommand.hpp"

#include <cstring>

namespace msg {

const char* PatternIdStr(PatternKind k) {
    switch (k) {
        case PatternKind::GRAYSCALE:     return "grayscale";
        case PatternKind::COLOR_CHECKER: return "colorchecker";
        case PatternKind::CHECKERBOARD:  return "checkerboard";
        default:                         return "unknown";
    }
}

bool PatternKindFromId(const char* id, PatternKind& out) {
    if (!id) return false;
    if (std::strcmp(id, "grayscale") == 0)    { out = PatternKind::GRAYSCALE;     return true; }
    if (std::strcmp(id, "colorchecker") == 0) { out = PatternKind::COLOR_CHECKER; return true; }
    if (std::strcmp(id, "checkerboard") == 0) { out = PatternKind::CHECKERBOARD;  return true; }
    return false;
}

const char* RemoteCommandTypeStr(RemoteCommandType t) {
    switch (t) {
        case RemoteCommandType::SET_PATTERN:       return "SET_PATTERN";
        case RemoteCommandType::ADJUST_BRIGHTNESS: return "ADJUST_BRIGHTNESS";
        case RemoteCommandType::ADJUST_CONTRAST:   return "ADJUST_CONTRAST";
        case RemoteCommandType::RESET:             return "RESET";
        default:                                   return "UNKNOWN";
    }
}

bool RemoteCommandTypeFromStr(const std::string& s, RemoteCommandType& out) {
    if (s == "SET_PATTERN")       { out = RemoteCommandType::SET_PATTERN;       return true; }
    if (s == "ADJUST_BRIGHTNESS") { out = RemoteCommandType::ADJUST_BRIGHTNESS; return true; }
    if (s == "ADJUST_CONTRAST")   { out = RemoteCommandType::ADJUST_CONTRAST;   return true; }
    if (s == "RESET")             { out = RemoteCommandType::RESET;             return true; }
    return false;
}

} // namespace msg
