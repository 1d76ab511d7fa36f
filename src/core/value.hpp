#pragma once

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

// A loosely-typed record value: null, bool, number, text, list or map.
//
// Records are Values of kind Map. They are read-only once parsed; all
// rendering goes through the free functions below, which are total over
// every kind. Lists and maps are held behind shared immutable pointers, so
// copying a Value never copies a subtree.
class Value {
public:
    enum class Kind { Null, Bool, Number, Text, List, Map };

    using List = std::vector<Value>;
    using Map = std::map<std::string, Value>;   // keys stay sorted

    Value() = default;

    static Value null() { return Value(); }
    static Value boolean(bool b);
    static Value number(double n);
    static Value text(std::string s);
    static Value list(List items);
    static Value map(Map entries);

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool is_null() const { return kind() == Kind::Null; }
    bool is_map() const { return kind() == Kind::Map; }

    // Accessors return false / 0 / empty for a value of another kind.
    bool as_bool() const;
    double as_number() const;
    const std::string& as_text() const;
    const List& as_list() const;
    const Map& as_map() const;

    // Field lookup on a Map. Returns nullptr for absent keys or non-maps.
    const Value* find(const std::string& key) const;

private:
    // Alternative order matches Kind.
    using Storage = std::variant<std::monostate, bool, double, std::string,
                                 std::shared_ptr<const List>, std::shared_ptr<const Map>>;
    Storage data_;
};

using Record = Value;

// Compact JSON: no whitespace, keys sorted.
std::string to_json(const Value& v);

// Text used for display and filtering. Text renders raw, containers as JSON,
// null as "<nil>".
std::string render_display_string(const Value& v);

// Text printed for `-o attr`: integral numbers without a fraction, null as "null".
std::string format_output_value(const Value& v);

// Shortest round-trip digits of a number, in exponent form when the decimal
// exponent is below -4 or at least 6 ("42", "3.5", "123456", "1e+06").
std::string format_number(double n);

// Number as written in JSON: plain decimal for magnitudes in [1e-6, 1e21),
// exponent form otherwise ("1000000", "1e+21", "1e-7").
std::string format_json_number(double n);
