#pragma once

#include <string>
#include <vector>
#include "picker_state.hpp"

// One painted line, kept unstyled so frames can be inspected in tests.
struct FrameLine {
    enum class Kind { Header, Item, NoMatches };

    Kind kind = Kind::Item;
    std::string text;       // full text including the "> " / "  " prefix
    bool cursor = false;
    bool marked = false;
};

// Lay out a frame: the filter header, one line per visible match, or the
// "(no matches)" line.
//
// Cursor and marked rows are padded to the widest visible display value so
// their background forms an even block. Padding is skipped for the whole
// frame when any visible item wraps.
std::vector<FrameLine> render_frame(const PickerState& state,
                                    const ViewportState& viewport,
                                    const PickerContext& ctx);

// Line with its ANSI styling applied.
std::string styled_line(const FrameLine& line);

// Clear-screen, cursor-home, then every styled line terminated by "\r\n".
std::string compose_frame(const std::vector<FrameLine>& lines);
