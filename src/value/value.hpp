#pragma once

#include "ordered_map.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace kdlgen {

/**

 Generic configuration value tree

 This is the input of the KDL serializer: a tree of tables, arrays and scalars,
 the same shape a host configuration layer hands over after it has merged
 all user settings.

    {
        input = {
            keyboard = { layout = "us" }
        }
        spawn-at-startup = ["waybar"]
    }

 Tables keep their insertion order. Every Value owns its children, so a
 value tree can never contain a cycle.
*/

// Order matches the alternatives in Value::v
enum class ValueType {
    Null,
    Bool,
    Int,
    Float,
    String,
    Table,
    Array,

    // The variant lost its value because an assignment threw.
    Invalid,
};

struct Value {
    using Null = std::monostate;
    using Bool = bool;
    using Int = int64_t;
    using Float = double;
    using String = std::string;
    using Table = OrderedMap<std::string, Value>;
    using Array = std::vector<Value>;

    std::variant<Null, Bool, Int, Float, String, Table, Array> v;

    // clang-format off
    Value() = default;
    Value(Null) : v(Null{}) {}
    Value(bool b) : v(Bool{b}) {}
    Value(int i) : v(Int{i}) {}
    Value(Int i) : v(i) {}
    Value(Float f) : v(f) {}
    Value(const char* s) : v(String{s}) {}
    Value(String s) : v(std::move(s)) {}
    Value(Table t) : v(std::move(t)) {}
    Value(Array a) : v(std::move(a)) {}
    // clang-format on

    Value&
    operator[](const std::string& key);

    Value&
    operator[](std::size_t index);

    bool
    contains(const std::string& key) const;

    ValueType
    type() const {
        if (v.valueless_by_exception()) {
            return ValueType::Invalid;
        }
        return static_cast<ValueType>(v.index());
    }

    // Null, Bool, Int, Float or String
    bool
    is_scalar() const;

    // clang-format off
    bool is_null() const { return std::holds_alternative<Value::Null>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_float() const { return std::holds_alternative<Value::Float>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_array() const { return std::holds_alternative<Value::Array>(v); }

    Bool& as_bool() { return std::get<Value::Bool>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Float& as_float() { return std::get<Value::Float>(v); }
    String& as_string() { return std::get<Value::String>(v); }
    Table& as_table() { return std::get<Value::Table>(v); }
    Array& as_array() { return std::get<Value::Array>(v); }

    const Bool& as_bool() const { return std::get<Value::Bool>(v); }
    const Int& as_int() const { return std::get<Value::Int>(v); }
    const Float& as_float() const { return std::get<Value::Float>(v); }
    const String& as_string() const { return std::get<Value::String>(v); }
    const Table& as_table() const { return std::get<Value::Table>(v); }
    const Array& as_array() const { return std::get<Value::Array>(v); }
    // clang-format on
};

std::string
type_name(ValueType type);

// Short one-line description; i.e `Integer<3>` or `Table{2}`
std::string
repr(const Value& v);

// Indented dump of the whole tree
std::string
dump_value_object(const Value& v);

}  // namespace kdlgen
