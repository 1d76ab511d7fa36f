#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Defaults for a picker session. Command-line flags override these.
struct PickerSettings {
    std::string separator = DEFAULT_SEPARATOR;
    bool truncate = false;
    bool table_mode = false;
    int chrome_rows = DEFAULT_CHROME_ROWS;
    bool log = false;
};

class Config {
public:
    // Load ~/.jpick/config.yaml (or $JPICK_CONFIG). A missing file yields defaults.
    static Result<Config> load();

    // Load a specific file. A missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    const PickerSettings& settings() const { return settings_; }
    const fs::path& source() const { return source_; }

    Config() = default;

private:
    PickerSettings settings_;
    fs::path source_;
};

fs::path get_config_dir();
fs::path get_config_path();
