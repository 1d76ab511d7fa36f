#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// How a record becomes a display string.
struct DisplaySpec {
    std::vector<std::string> fields;    // projected fields, in order (empty = whole record as JSON)
    std::string separator = DEFAULT_SEPARATOR;  // joins projected fields (ignored in table mode)
    bool table_mode = false;            // pad all but the last field to the column width
    bool truncate = false;              // one row per item, ellipsis instead of wrapping
};

// Terminal size in character cells, captured once per session.
struct TermGeometry {
    int width = 80;
    int height = 24;
};

// Indices into the record sequence. Stable for the whole session.
using RecordPos = std::size_t;
using PositionList = std::vector<RecordPos>;
