#include "value.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <utility>

Value Value::boolean(bool b) {
    Value v;
    v.data_.emplace<bool>(b);
    return v;
}

Value Value::number(double n) {
    Value v;
    v.data_.emplace<double>(n);
    return v;
}

Value Value::text(std::string s) {
    Value v;
    v.data_.emplace<std::string>(std::move(s));
    return v;
}

Value Value::list(List items) {
    Value v;
    v.data_ = std::make_shared<const List>(std::move(items));
    return v;
}

Value Value::map(Map entries) {
    Value v;
    v.data_ = std::make_shared<const Map>(std::move(entries));
    return v;
}

bool Value::as_bool() const {
    const bool* b = std::get_if<bool>(&data_);
    return b ? *b : false;
}

double Value::as_number() const {
    const double* n = std::get_if<double>(&data_);
    return n ? *n : 0.0;
}

const std::string& Value::as_text() const {
    static const std::string empty;
    const std::string* s = std::get_if<std::string>(&data_);
    return s ? *s : empty;
}

const Value::List& Value::as_list() const {
    static const List empty;
    const auto* p = std::get_if<std::shared_ptr<const List>>(&data_);
    return p ? **p : empty;
}

const Value::Map& Value::as_map() const {
    static const Map empty;
    const auto* p = std::get_if<std::shared_ptr<const Map>>(&data_);
    return p ? **p : empty;
}

const Value* Value::find(const std::string& key) const {
    if (kind() != Kind::Map) return nullptr;
    const Map& m = as_map();
    auto it = m.find(key);
    if (it == m.end()) return nullptr;
    return &it->second;
}

// ── Number text ───────────────────────────────────────────────

namespace {

// Shortest round-trip digits: value = 0.<digits> x 10^point.
struct Decimal {
    bool negative = false;
    std::string digits;
    int point = 0;
};

Decimal shortest_decimal(double n) {
    // fmt's default presentation is the shortest round-trip form; only the
    // notation is re-chosen below.
    std::string s = fmt::format("{}", n);
    Decimal d;

    size_t i = 0;
    if (s[i] == '-') {
        d.negative = true;
        i++;
    }
    size_t e = s.find_first_of("eE", i);
    std::string mantissa = s.substr(i, e == std::string::npos ? std::string::npos : e - i);
    int exp = e == std::string::npos ? 0 : std::atoi(s.c_str() + e + 1);

    size_t dot = mantissa.find('.');
    std::string int_part = dot == std::string::npos ? mantissa : mantissa.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : mantissa.substr(dot + 1);
    d.digits = int_part + frac;
    d.point = static_cast<int>(int_part.size()) + exp;

    size_t lead = d.digits.find_first_not_of('0');
    if (lead == std::string::npos) {
        d.digits = "0";
        d.point = 1;
        return d;
    }
    d.digits.erase(0, lead);
    d.point -= static_cast<int>(lead);
    d.digits.erase(d.digits.find_last_not_of('0') + 1);
    return d;
}

std::string exponent_form(const Decimal& d, int min_exp_digits) {
    std::string out = d.negative ? "-" : "";
    out += d.digits[0];
    if (d.digits.size() > 1) {
        out += '.';
        out += d.digits.substr(1);
    }
    int exp = d.point - 1;
    out += fmt::format("e{}{:0{}d}", exp < 0 ? '-' : '+', std::abs(exp), min_exp_digits);
    return out;
}

std::string plain_form(const Decimal& d) {
    std::string out = d.negative ? "-" : "";
    int nd = static_cast<int>(d.digits.size());
    if (d.point <= 0) {
        out += "0." + std::string(static_cast<size_t>(-d.point), '0') + d.digits;
    } else if (d.point >= nd) {
        out += d.digits + std::string(static_cast<size_t>(d.point - nd), '0');
    } else {
        out += d.digits.substr(0, d.point) + "." + d.digits.substr(d.point);
    }
    return out;
}

} // namespace

std::string format_number(double n) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n > 0 ? "+Inf" : "-Inf";

    Decimal d = shortest_decimal(n);
    int exp = d.point - 1;
    if (exp < -4 || exp >= 6) return exponent_form(d, 2);
    return plain_form(d);
}

std::string format_json_number(double n) {
    if (!std::isfinite(n)) return "null";

    Decimal d = shortest_decimal(n);
    double mag = std::fabs(n);
    if (mag != 0 && (mag < 1e-6 || mag >= 1e21)) return exponent_form(d, 1);
    return plain_form(d);
}

// ── JSON encoding ─────────────────────────────────────────────

static void append_json_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else
                    out += c;
        }
    }
    out += '"';
}

static void append_json(std::string& out, const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null:
            out += "null";
            break;
        case Value::Kind::Bool:
            out += v.as_bool() ? "true" : "false";
            break;
        case Value::Kind::Number:
            out += format_json_number(v.as_number());
            break;
        case Value::Kind::Text:
            append_json_string(out, v.as_text());
            break;
        case Value::Kind::List: {
            out += '[';
            bool first = true;
            for (const auto& item : v.as_list()) {
                if (!first) out += ',';
                first = false;
                append_json(out, item);
            }
            out += ']';
            break;
        }
        case Value::Kind::Map: {
            out += '{';
            bool first = true;
            for (const auto& [key, item] : v.as_map()) {
                if (!first) out += ',';
                first = false;
                append_json_string(out, key);
                out += ':';
                append_json(out, item);
            }
            out += '}';
            break;
        }
    }
}

std::string to_json(const Value& v) {
    std::string out;
    append_json(out, v);
    return out;
}

// ── Display / output text ─────────────────────────────────────

std::string render_display_string(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null:   return "<nil>";
        case Value::Kind::Bool:   return v.as_bool() ? "true" : "false";
        case Value::Kind::Number: return format_number(v.as_number());
        case Value::Kind::Text:   return v.as_text();
        case Value::Kind::List:
        case Value::Kind::Map:    return to_json(v);
    }
    return "";
}

std::string format_output_value(const Value& v) {
    if (v.kind() == Value::Kind::Null) return "null";
    if (v.kind() == Value::Kind::Number) {
        double n = v.as_number();
        if (std::isfinite(n) && std::trunc(n) == n && std::fabs(n) < 9.2e18)
            return fmt::format("{}", static_cast<int64_t>(n));
    }
    return render_display_string(v);
}
