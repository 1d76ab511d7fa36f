#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/value.hpp>

class DisplayFormatter;

// Current filter text and the record positions that match it.
// `matches` is always recomputed from `text` on every edit.
struct FilterState {
    std::string text;
    PositionList matches;
};

// Positions whose display value contains `filter_text`, case-insensitively,
// in original order. An empty filter matches every position.
PositionList apply_filter(const std::vector<std::string>& display_values,
                          const std::string& filter_text);

// Same, rendering each record through `formatter` first.
PositionList apply_filter(const std::vector<Record>& records,
                          const DisplayFormatter& formatter,
                          const std::string& filter_text);

// Filter with empty text over `count` records.
FilterState unfiltered(size_t count);

// Edits. Both recompute matches synchronously.
FilterState append_char(FilterState state, char ch,
                        const std::vector<std::string>& display_values);
FilterState erase_last_char(FilterState state,
                            const std::vector<std::string>& display_values);
