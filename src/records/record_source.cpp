#include "record_source.hpp"
#include <core/constants.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <istream>
#include <set>
#include <sstream>
#include <utility>

using json = nlohmann::json;

// JSON numbers all become doubles; out-of-range literals are rejected by the
// parser before they get here.
static Value json_to_value(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return Value::null();
        case json::value_t::boolean:
            return Value::boolean(j.get<bool>());
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return Value::number(j.get<double>());
        case json::value_t::string:
            return Value::text(j.get<std::string>());
        case json::value_t::array: {
            Value::List items;
            items.reserve(j.size());
            for (const auto& item : j) items.push_back(json_to_value(item));
            return Value::list(std::move(items));
        }
        case json::value_t::object: {
            Value::Map entries;
            for (const auto& item : j.items()) entries[item.key()] = json_to_value(item.value());
            return Value::map(std::move(entries));
        }
        case json::value_t::binary:
        case json::value_t::discarded:
            break;
    }
    return Value::null();
}

Result<std::vector<Record>> parse_json_records(const std::string& input) {
    json root;
    try {
        root = json::parse(input);
    } catch (const json::exception& e) {
        return Result<std::vector<Record>>::Err(fmt::format("error parsing JSON: {}", e.what()));
    }

    if (!root.is_array()) {
        return Result<std::vector<Record>>::Err("error parsing JSON: expected an array of objects");
    }

    std::vector<Record> records;
    records.reserve(root.size());
    for (size_t i = 0; i < root.size(); i++) {
        if (!root[i].is_object()) {
            return Result<std::vector<Record>>::Err(
                fmt::format("error parsing JSON: element {} is not an object", i));
        }
        records.push_back(json_to_value(root[i]));
    }
    return Result<std::vector<Record>>::Ok(std::move(records));
}

std::vector<Record> parse_line_records(const std::string& input) {
    std::vector<Record> records;
    size_t start = 0;
    while (start < input.size()) {
        size_t nl = input.find('\n', start);
        size_t end = (nl == std::string::npos) ? input.size() : nl;
        size_t len = end - start;
        if (len > 0 && input[end - 1] == '\r') len--;

        Value::Map entry;
        entry[LINE_MODE_FIELD] = Value::text(input.substr(start, len));
        records.push_back(Value::map(std::move(entry)));

        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return records;
}

Result<std::vector<Record>> parse_records(const std::string& input, bool line_mode) {
    std::vector<Record> records;
    if (line_mode) {
        records = parse_line_records(input);
    } else {
        auto parsed = parse_json_records(input);
        if (parsed.is_err()) return parsed;
        records = std::move(parsed.value);
    }

    if (records.empty()) {
        return Result<std::vector<Record>>::Err("no objects found in input");
    }
    return Result<std::vector<Record>>::Ok(std::move(records));
}

// ── Input ─────────────────────────────────────────────────────

Result<std::string> read_input(const std::string& filename, bool stdin_piped, std::istream& in) {
    if (stdin_piped && !filename.empty())
        return Result<std::string>::Err("cannot use both stdin and filename input");
    if (!stdin_piped && filename.empty())
        return Result<std::string>::Err("no input provided");

    std::ostringstream buf;
    if (!filename.empty()) {
        std::ifstream file(filename, std::ios::binary);
        if (!file)
            return Result<std::string>::Err(fmt::format("open {}: {}", filename, std::strerror(errno)));
        buf << file.rdbuf();
        if (file.bad())
            return Result<std::string>::Err(fmt::format("read {}: I/O error", filename));
    } else {
        buf << in.rdbuf();
        if (in.bad())
            return Result<std::string>::Err("read stdin: I/O error");
    }
    return Result<std::string>::Ok(buf.str());
}

std::vector<std::string> all_attributes(const std::vector<Record>& records) {
    std::set<std::string> keys;
    for (const auto& record : records) {
        for (const auto& kv : record.as_map()) keys.insert(kv.first);
    }
    return std::vector<std::string>(keys.begin(), keys.end());
}
