#include "frame_renderer.hpp"
#include "layout.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <cli/theme.hpp>
#include <algorithm>

static const char* kFilterLabel = "Filter:";

std::vector<FrameLine> render_frame(const PickerState& state,
                                    const ViewportState& viewport,
                                    const PickerContext& ctx) {
    std::vector<FrameLine> lines;

    FrameLine header;
    header.kind = FrameLine::Kind::Header;
    header.text = std::string(kFilterLabel) + " " + state.filter.text;
    lines.push_back(header);

    const auto& matches = state.filter.matches;
    if (matches.empty()) {
        FrameLine empty;
        empty.kind = FrameLine::Kind::NoMatches;
        empty.text = std::string("  ") + NO_MATCHES_TEXT;
        lines.push_back(empty);
        return lines;
    }

    size_t end = std::min(viewport.end, matches.size());
    bool truncate = ctx.spec.truncate;
    int width = ctx.geometry.width;

    // Visible texts, shortened in truncate mode
    std::vector<std::string> texts;
    size_t max_width = 0;
    bool wrapping = false;
    for (size_t i = viewport.start; i < end; i++) {
        std::string text = ctx.display_values[matches[i]];
        if (truncate) {
            text = truncate_to_width(text, width);
        } else if (static_cast<int>(text.size()) > item_text_width(width)) {
            wrapping = true;
        }
        max_width = std::max(max_width, text.size());
        texts.push_back(std::move(text));
    }

    for (size_t i = viewport.start; i < end; i++) {
        FrameLine line;
        line.cursor = (i == state.selection.cursor);
        line.marked = state.selection.marked.count(matches[i]) > 0;

        const std::string& text = texts[i - viewport.start];
        bool styled = line.cursor || line.marked;
        std::string body = (styled && !wrapping) ? pad_right(text, max_width) : text;
        line.text = (line.cursor ? "> " : "  ") + body;
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string styled_line(const FrameLine& line) {
    using namespace theme;
    switch (line.kind) {
        case FrameLine::Kind::Header:
            return color::CYAN + kFilterLabel + color::RESET + line.text.substr(std::string(kFilterLabel).size());
        case FrameLine::Kind::NoMatches:
            return line.text;
        case FrameLine::Kind::Item:
            break;
    }

    if (line.cursor && line.marked) return color::REVERSE + color::MARK_BG + line.text + color::RESET;
    if (line.cursor) return color::REVERSE + line.text + color::RESET;
    if (line.marked) return color::MARK_BG + line.text + color::RESET;
    return line.text;
}

std::string compose_frame(const std::vector<FrameLine>& lines) {
    std::string out = theme::screen::CLEAR + theme::screen::HOME;
    for (const auto& line : lines) {
        out += styled_line(line);
        out += "\r\n";
    }
    return out;
}
