#pragma once

#include <string>
#include <vector>
#include <iosfwd>
#include <core/types.hpp>
#include <core/value.hpp>

// Record source: turns raw input text into the session's record sequence.
//
// JSON mode expects an array of objects. Line mode wraps every input line
// as {"line": <text>}. Either way, zero records is an error.

Result<std::vector<Record>> parse_records(const std::string& input, bool line_mode);

Result<std::vector<Record>> parse_json_records(const std::string& input);
std::vector<Record> parse_line_records(const std::string& input);

// Read the whole input from `filename`, or from `in` when input is piped.
// Exactly one of the two must be present.
Result<std::string> read_input(const std::string& filename, bool stdin_piped, std::istream& in);

// Union of the keys of every record, sorted ascending.
std::vector<std::string> all_attributes(const std::vector<Record>& records);
