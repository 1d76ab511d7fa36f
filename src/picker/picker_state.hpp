#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "filter.hpp"
#include "selection.hpp"
#include "viewport.hpp"
#include "input_decoder.hpp"

// Session-wide inputs. Fixed once the session starts.
struct PickerContext {
    std::vector<std::string> display_values;    // indexed by record position
    DisplaySpec spec;
    TermGeometry geometry;
    int chrome_rows = DEFAULT_CHROME_ROWS;
};

// Everything that changes between frames.
struct PickerState {
    FilterState filter;
    SelectionState selection;
};

enum class Outcome { Continue, Confirm, Cancel };

struct Transition {
    PickerState state;
    Outcome outcome = Outcome::Continue;
};

// All records match, cursor on the first, nothing marked.
PickerState initial_state(const PickerContext& ctx);

// Apply one decoded action. Filter edits re-filter and clamp the cursor.
Transition reduce(const PickerState& state, const Action& action, const PickerContext& ctx);

// Row cost of one record in this session's layout.
int item_rows(const PickerContext& ctx, RecordPos pos);

// Visible slice for the current state.
ViewportState window_for(const PickerState& state, const PickerContext& ctx);

// Records chosen on confirm.
PositionList selection_result(const PickerState& state);
