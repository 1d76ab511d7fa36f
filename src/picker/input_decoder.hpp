#pragma once

#include <cstddef>
#include <optional>

// Discrete actions decoded from raw terminal reads.
enum class ActionType {
    CharTyped,
    Backspace,
    MoveUp,
    MoveDown,
    ToggleMark,
    Confirm,
    Cancel,
};

struct Action {
    ActionType type;
    char ch = 0;    // set for CharTyped
};

// Classify one read. A single byte is a key; a 3-byte read starting ESC [
// is an arrow key. Anything else, including unknown escape sequences and
// multi-byte reads, decodes to nothing.
//
//   3, 27        Cancel         10, 13    Confirm
//   127          Backspace      0         ToggleMark (Ctrl+Space)
//   32..126      CharTyped      ESC [ A   MoveUp      ESC [ B   MoveDown
std::optional<Action> decode_input(const unsigned char* buf, size_t n);

const char* action_name(ActionType type);
