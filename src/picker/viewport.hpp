#pragma once

#include <functional>
#include <core/types.hpp>

// Half-open range [start, end) of match-list indices painted this frame.
struct ViewportState {
    size_t start = 0;
    size_t end = 0;

    bool contains(size_t index) const { return index >= start && index < end; }
    size_t size() const { return end - start; }
};

// Row cost of the record at a position.
using RowCost = std::function<int(RecordPos)>;

// Rows left for items after the fixed chrome. Never below 1.
int available_rows(const TermGeometry& geometry, int chrome_rows);

// Centered expansion around the cursor.
//
// Grows upward from the cursor while the rows taken stay within half the
// budget, then charges the cursor item, then grows downward until the full
// budget is used. Upward growth is capped before the cursor's own cost is
// known, so a tall cursor item can leave part of the budget unused; the
// window favors items after the cursor.
//
// Empty matches give (0, 0). Otherwise the cursor is always inside the window.
ViewportState compute_window(const PositionList& matches, size_t cursor,
                             int available_rows, const RowCost& rows_for);
