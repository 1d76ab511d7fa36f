#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/value.hpp>

// Command-line options as given. Unset flags fall back to the config file.
struct CliOptions {
    std::vector<std::string> display_attrs;     // -d, repeatable, order kept
    std::string output_attr;                    // -o
    std::optional<std::string> separator;       // -s
    bool truncate = false;                      // -t
    bool table_mode = false;                    // -T
    bool line_mode = false;                     // -l
    bool all_attrs = false;                     // -a
    std::string filename;                       // last bare argument
    bool help = false;
    bool version = false;
};

CliOptions parse_args(const std::vector<std::string>& args);

// Reject flag combinations that make no sense together.
Result<void> validate_options(const CliOptions& opts);

// What to show and what to print for this session.
struct SessionPlan {
    DisplaySpec spec;
    std::string output_attr;
};

SessionPlan build_plan(const CliOptions& opts, const PickerSettings& settings,
                       const std::vector<Record>& records);

std::string usage_text();
