#include "selection.hpp"

SelectionState move_up(SelectionState s) {
    if (s.cursor > 0) s.cursor--;
    return s;
}

SelectionState move_down(SelectionState s, size_t match_count) {
    if (s.cursor + 1 < match_count) s.cursor++;
    return s;
}

SelectionState clamp_cursor(SelectionState s, size_t match_count) {
    if (match_count == 0) s.cursor = 0;
    else if (s.cursor >= match_count) s.cursor = match_count - 1;
    return s;
}

SelectionState toggle_mark(SelectionState s, const PositionList& matches) {
    if (matches.empty() || s.cursor >= matches.size()) return s;

    RecordPos pos = matches[s.cursor];
    if (!s.marked.erase(pos)) s.marked.insert(pos);

    if (s.cursor + 1 < matches.size()) s.cursor++;
    return s;
}

PositionList current_selection(const SelectionState& s, const PositionList& matches) {
    if (!s.marked.empty()) {
        // std::set iterates in ascending order
        return PositionList(s.marked.begin(), s.marked.end());
    }
    if (matches.empty() || s.cursor >= matches.size()) return {};
    return {matches[s.cursor]};
}
