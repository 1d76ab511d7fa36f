#include "viewport.hpp"
#include <algorithm>

int available_rows(const TermGeometry& geometry, int chrome_rows) {
    return std::max(1, geometry.height - chrome_rows);
}

ViewportState compute_window(const PositionList& matches, size_t cursor,
                             int available_rows, const RowCost& rows_for) {
    ViewportState vp;
    if (matches.empty()) return vp;

    int budget = std::max(1, available_rows);
    cursor = std::min(cursor, matches.size() - 1);

    // Expand upward, capped at half the budget
    int used = 0;
    size_t start = cursor;
    while (start > 0) {
        int cost = rows_for(matches[start - 1]);
        if (used + cost > budget / 2) break;
        start--;
        used += cost;
    }

    used += rows_for(matches[cursor]);

    // Expand downward with whatever is left
    size_t end = cursor + 1;
    while (end < matches.size()) {
        int cost = rows_for(matches[end]);
        if (used + cost > budget) break;
        used += cost;
        end++;
    }

    vp.start = start;
    vp.end = end;
    return vp;
}
