#pragma once

#include <core/types.hpp>
#include <picker/picker_state.hpp>
#include <platform/terminal.hpp>

// PickerSession: the interactive loop on the controlling terminal.
//
// Flow per iteration:
//   tty read (blocking) → decode_input() → reduce() → window_for() → paint
//
// Raw mode and the alternate screen are held by RAII guards for the whole
// loop, so every return path, errors included, restores the terminal.
class PickerSession {
public:
    PickerSession(platform::Tty& tty, PickerContext ctx);

    // Selected record positions, ascending when several are marked.
    // Empty when cancelled or confirmed with nothing to select.
    Result<PositionList> run();

private:
    Result<void> paint();

    platform::Tty& tty_;
    PickerContext ctx_;
    PickerState state_;
};
