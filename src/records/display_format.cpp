#include "display_format.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>

DisplayFormatter::DisplayFormatter(DisplaySpec spec, const std::vector<Record>& records)
    : spec_(std::move(spec)) {
    if (!spec_.table_mode || spec_.fields.empty()) return;

    col_widths_.assign(spec_.fields.size(), 0);
    for (const auto& record : records) {
        for (size_t i = 0; i < spec_.fields.size(); i++) {
            if (!record.find(spec_.fields[i])) continue;
            col_widths_[i] = std::max(col_widths_[i], field_text(record, spec_.fields[i]).size());
        }
    }
}

std::string DisplayFormatter::field_text(const Record& record, const std::string& field) const {
    const Value* v = record.find(field);
    if (!v) return "";
    return render_display_string(*v);
}

std::string DisplayFormatter::display_value(const Record& record) const {
    if (spec_.fields.empty()) return to_json(record);

    std::string out;
    std::string joiner = spec_.table_mode ? std::string(TABLE_COLUMN_GAP) : spec_.separator;
    for (size_t i = 0; i < spec_.fields.size(); i++) {
        std::string text = field_text(record, spec_.fields[i]);
        // Last column is never padded
        if (spec_.table_mode && i < col_widths_.size() && i + 1 < spec_.fields.size())
            text = pad_right(text, col_widths_[i]);
        if (i > 0) out += joiner;
        out += text;
    }
    return out;
}

std::vector<std::string> DisplayFormatter::format_all(const std::vector<Record>& records) const {
    std::vector<std::string> out;
    out.reserve(records.size());
    for (const auto& record : records) out.push_back(display_value(record));
    return out;
}
