#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/value.hpp>

// Turns records into display strings according to a DisplaySpec.
//
// Table mode measures every projected field across the whole record set once,
// at construction; the widths never change for the rest of the session.
class DisplayFormatter {
public:
    DisplayFormatter(DisplaySpec spec, const std::vector<Record>& records);

    std::string display_value(const Record& record) const;

    // Display value of every record, indexed by record position.
    std::vector<std::string> format_all(const std::vector<Record>& records) const;

    const std::vector<size_t>& column_widths() const { return col_widths_; }

private:
    std::string field_text(const Record& record, const std::string& field) const;

    DisplaySpec spec_;
    std::vector<size_t> col_widths_;
};
