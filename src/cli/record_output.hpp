#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/value.hpp>

// Output lines for the chosen records, one per position, in the given order.
// With `output_attr` set, each line is that field's value; otherwise the
// whole record as compact JSON. A chosen record without the field is an error.
Result<std::vector<std::string>> format_selection(const std::vector<Record>& records,
                                                  const PositionList& positions,
                                                  const std::string& output_attr);
