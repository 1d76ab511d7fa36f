#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>

// ── Paths ─────────────────────────────────────────────────────

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    const char* override_path = std::getenv(CONFIG_PATH_ENV);
    if (override_path && *override_path) return fs::path(override_path);
    return get_config_dir() / CONFIG_FILE_NAME;
}

// ── Parsing ───────────────────────────────────────────────────

static PickerSettings parse_settings(const YAML::Node& root) {
    PickerSettings s;
    if (!root || root.IsNull()) return s;

    s.separator = root["separator"].as<std::string>(s.separator);
    s.truncate = root["truncate"].as<bool>(s.truncate);
    s.table_mode = root["table"].as<bool>(s.table_mode);
    s.chrome_rows = root["chrome_rows"].as<int>(s.chrome_rows);
    s.log = root["log"].as<bool>(s.log);

    if (s.chrome_rows < MIN_CHROME_ROWS) s.chrome_rows = MIN_CHROME_ROWS;
    return s;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("config must be a mapping of settings");
        }
        Config config;
        config.settings_ = parse_settings(root);
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("invalid config: {}", e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        Config config;
        config.source_ = path;
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err(fmt::format("{}: config must be a mapping of settings", path.string()));
        }
        Config config;
        config.settings_ = parse_settings(root);
        config.source_ = path;
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load() {
    return load_file(get_config_path());
}
