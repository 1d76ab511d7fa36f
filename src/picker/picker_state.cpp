#include "picker_state.hpp"
#include "layout.hpp"

PickerState initial_state(const PickerContext& ctx) {
    PickerState state;
    state.filter = unfiltered(ctx.display_values.size());
    return state;
}

Transition reduce(const PickerState& state, const Action& action, const PickerContext& ctx) {
    Transition t{state, Outcome::Continue};
    size_t match_count = state.filter.matches.size();

    switch (action.type) {
        case ActionType::Cancel:
            t.outcome = Outcome::Cancel;
            break;
        case ActionType::Confirm:
            t.outcome = Outcome::Confirm;
            break;
        case ActionType::MoveUp:
            t.state.selection = move_up(state.selection);
            break;
        case ActionType::MoveDown:
            t.state.selection = move_down(state.selection, match_count);
            break;
        case ActionType::ToggleMark:
            t.state.selection = toggle_mark(state.selection, state.filter.matches);
            break;
        case ActionType::CharTyped:
            t.state.filter = append_char(state.filter, action.ch, ctx.display_values);
            t.state.selection = clamp_cursor(state.selection, t.state.filter.matches.size());
            break;
        case ActionType::Backspace:
            t.state.filter = erase_last_char(state.filter, ctx.display_values);
            t.state.selection = clamp_cursor(state.selection, t.state.filter.matches.size());
            break;
    }
    return t;
}

int item_rows(const PickerContext& ctx, RecordPos pos) {
    return rows_for(ctx.display_values[pos], ctx.geometry.width, ctx.spec.truncate);
}

ViewportState window_for(const PickerState& state, const PickerContext& ctx) {
    return compute_window(state.filter.matches, state.selection.cursor,
                          available_rows(ctx.geometry, ctx.chrome_rows),
                          [&ctx](RecordPos pos) { return item_rows(ctx, pos); });
}

PositionList selection_result(const PickerState& state) {
    return current_selection(state.selection, state.filter.matches);
}
