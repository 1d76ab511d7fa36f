#pragma once

#include <set>
#include <core/types.hpp>

// Cursor into the match list plus the set of marked record positions.
//
// Marks are record positions, not match indices, so they survive any change
// to the filter.
struct SelectionState {
    size_t cursor = 0;
    std::set<RecordPos> marked;
};

SelectionState move_up(SelectionState s);
SelectionState move_down(SelectionState s, size_t match_count);

// Keep the cursor inside [0, match_count - 1]; 0 when there are no matches.
SelectionState clamp_cursor(SelectionState s, size_t match_count);

// Flip the mark on the record under the cursor, then step down one match
// unless already on the last one. No-op with no matches.
SelectionState toggle_mark(SelectionState s, const PositionList& matches);

// Marked positions in ascending order when any are marked, otherwise the
// record under the cursor (empty with no matches).
PositionList current_selection(const SelectionState& s, const PositionList& matches);
