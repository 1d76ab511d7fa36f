#include "picker_session.hpp"
#include <picker/frame_renderer.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <utility>

PickerSession::PickerSession(platform::Tty& tty, PickerContext ctx)
    : tty_(tty), ctx_(std::move(ctx)), state_(initial_state(ctx_)) {}

Result<void> PickerSession::paint() {
    ViewportState vp = window_for(state_, ctx_);
    return tty_.write_all(compose_frame(render_frame(state_, vp, ctx_)));
}

Result<PositionList> PickerSession::run() {
    platform::RawModeGuard raw(tty_.fd());
    if (!raw.active()) return Result<PositionList>::Err(raw.error());

    platform::ScreenGuard screen(tty_);

    jpick_log(fmt::format("session: {} records, {}x{} terminal, {} rows for items",
                          ctx_.display_values.size(), ctx_.geometry.width, ctx_.geometry.height,
                          available_rows(ctx_.geometry, ctx_.chrome_rows)));

    auto painted = paint();
    if (painted.is_err()) return Result<PositionList>::Err(painted.error);

    unsigned char buf[INPUT_READ_BUF_SIZE];
    for (;;) {
        auto n = tty_.read_bytes(buf, sizeof(buf));
        if (n.is_err()) {
            jpick_log(fmt::format("session: {}", n.error));
            return Result<PositionList>::Err(n.error);
        }

        auto action = decode_input(buf, static_cast<size_t>(n.value));
        if (!action) continue;     // unrecognized keys leave state untouched

        Transition t = reduce(state_, *action, ctx_);
        state_ = std::move(t.state);

        if (t.outcome == Outcome::Cancel) {
            jpick_log("session: cancelled");
            return Result<PositionList>::Ok({});
        }
        if (t.outcome == Outcome::Confirm) {
            PositionList chosen = selection_result(state_);
            jpick_log(fmt::format("session: confirmed [{}]", fmt::join(chosen, ", ")));
            return Result<PositionList>::Ok(chosen);
        }

        jpick_log(fmt::format("action={} filter='{}' matches={} cursor={} marked={}",
                              action_name(action->type), state_.filter.text,
                              state_.filter.matches.size(), state_.selection.cursor,
                              state_.selection.marked.size()));

        painted = paint();
        if (painted.is_err()) return Result<PositionList>::Err(painted.error);
    }
}
