#include "record_output.hpp"
#include <fmt/format.h>
#include <utility>

Result<std::vector<std::string>> format_selection(const std::vector<Record>& records,
                                                  const PositionList& positions,
                                                  const std::string& output_attr) {
    std::vector<std::string> lines;
    lines.reserve(positions.size());

    for (RecordPos pos : positions) {
        if (pos >= records.size()) {
            return Result<std::vector<std::string>>::Err(
                fmt::format("selected position {} out of range", pos));
        }
        const Record& record = records[pos];

        if (output_attr.empty()) {
            lines.push_back(to_json(record));
            continue;
        }

        const Value* v = record.find(output_attr);
        if (!v) {
            return Result<std::vector<std::string>>::Err(
                fmt::format("attribute '{}' not found in selected object", output_attr));
        }
        lines.push_back(format_output_value(*v));
    }
    return Result<std::vector<std::string>>::Ok(std::move(lines));
}
