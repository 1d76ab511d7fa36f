#pragma once

#include <string>

// Columns left for item text once the "> " prefix is drawn. May be <= 0 on
// degenerate terminals; callers clamp.
int item_text_width(int term_width);

// Terminal rows an item occupies. Always >= 1.
//   truncate: exactly one row.
//   wrap:     ceil(len / (width - 2)); empty strings and widths <= 2 cost one row.
int rows_for(const std::string& display, int term_width, bool truncate);

// Shorten `display` to fit one row, ending in "..." when cut.
// Strings that already fit, or rows too narrow for an ellipsis, are unchanged.
std::string truncate_to_width(const std::string& display, int term_width);
