#include "filter.hpp"
#include <core/utils.hpp>
#include <records/display_format.hpp>

PositionList apply_filter(const std::vector<std::string>& display_values,
                          const std::string& filter_text) {
    PositionList matches;
    matches.reserve(display_values.size());

    if (filter_text.empty()) {
        for (RecordPos i = 0; i < display_values.size(); i++) matches.push_back(i);
        return matches;
    }

    std::string needle = to_lower(filter_text);
    for (RecordPos i = 0; i < display_values.size(); i++) {
        if (to_lower(display_values[i]).find(needle) != std::string::npos)
            matches.push_back(i);
    }
    return matches;
}

PositionList apply_filter(const std::vector<Record>& records,
                          const DisplayFormatter& formatter,
                          const std::string& filter_text) {
    return apply_filter(formatter.format_all(records), filter_text);
}

FilterState unfiltered(size_t count) {
    FilterState state;
    state.matches.reserve(count);
    for (RecordPos i = 0; i < count; i++) state.matches.push_back(i);
    return state;
}

FilterState append_char(FilterState state, char ch,
                        const std::vector<std::string>& display_values) {
    state.text += ch;
    state.matches = apply_filter(display_values, state.text);
    return state;
}

FilterState erase_last_char(FilterState state,
                            const std::vector<std::string>& display_values) {
    if (state.text.empty()) return state;
    state.text.pop_back();
    state.matches = apply_filter(display_values, state.text);
    return state;
}
