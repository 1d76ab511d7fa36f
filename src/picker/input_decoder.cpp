#include "input_decoder.hpp"

static std::optional<Action> decode_single(unsigned char b) {
    switch (b) {
        case 0:   return Action{ActionType::ToggleMark};
        case 3:
        case 27:  return Action{ActionType::Cancel};
        case 10:
        case 13:  return Action{ActionType::Confirm};
        case 127: return Action{ActionType::Backspace};
        default:  break;
    }
    if (b >= 32 && b <= 126)
        return Action{ActionType::CharTyped, static_cast<char>(b)};
    return std::nullopt;
}

std::optional<Action> decode_input(const unsigned char* buf, size_t n) {
    if (!buf) return std::nullopt;

    if (n == 1) return decode_single(buf[0]);

    if (n == 3 && buf[0] == 27 && buf[1] == '[') {
        if (buf[2] == 'A') return Action{ActionType::MoveUp};
        if (buf[2] == 'B') return Action{ActionType::MoveDown};
    }
    return std::nullopt;
}

const char* action_name(ActionType type) {
    switch (type) {
        case ActionType::CharTyped:  return "char";
        case ActionType::Backspace:  return "backspace";
        case ActionType::MoveUp:     return "up";
        case ActionType::MoveDown:   return "down";
        case ActionType::ToggleMark: return "toggle";
        case ActionType::Confirm:    return "confirm";
        case ActionType::Cancel:     return "cancel";
    }
    return "unknown";
}
