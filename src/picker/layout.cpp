#include "layout.hpp"
#include <core/constants.hpp>
#include <cstring>

int item_text_width(int term_width) {
    return term_width - ROW_PREFIX_WIDTH;
}

int rows_for(const std::string& display, int term_width, bool truncate) {
    if (display.empty() || truncate) return 1;

    int width = item_text_width(term_width);
    if (width <= 0) return 1;

    int len = static_cast<int>(display.size());
    int rows = (len + width - 1) / width;
    return rows < 1 ? 1 : rows;
}

std::string truncate_to_width(const std::string& display, int term_width) {
    int width = item_text_width(term_width);
    int ellipsis_len = static_cast<int>(std::strlen(ELLIPSIS));
    if (static_cast<int>(display.size()) <= width || width <= ellipsis_len) return display;
    return display.substr(0, width - ellipsis_len) + ELLIPSIS;
}
