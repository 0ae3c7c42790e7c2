#include "value.hpp"

#include <fmt/format.h>

#include <cassert>
#include <string>

using namespace kdlgen;

namespace internal {

void
dump_value_object(const Value& v, std::string& s, int depth) {
    auto INDENT = [](int x) { return std::string((x) *2, ' '); };

    s += INDENT(depth);

    switch (v.type()) {
        case ValueType::Table: {
            s += "Table {\n";
            v.as_table().for_each([depth, &s, INDENT](const std::string& key, const Value& value) {
                s += fmt::format("{}Key: '{}'\n", INDENT(depth + 1), key);
                dump_value_object(value, s, depth + 2);
            });
            s += fmt::format("{}}}\n", INDENT(depth));
        } break;
        case ValueType::Array: {
            s += "Array [\n";
            for (auto& value : v.as_array()) {
                dump_value_object(value, s, depth + 1);
            }
            s += fmt::format("{}]\n", INDENT(depth));
        } break;
        case ValueType::Null:
        case ValueType::Bool:
        case ValueType::Int:
        case ValueType::Float:
        case ValueType::String:
        case ValueType::Invalid: {
            s += repr(v) + "\n";
        } break;
    }
}

}  // namespace internal

Value&
Value::operator[](const std::string& key) {
    assert(is_table());
    return as_table()[key];
}

Value&
Value::operator[](std::size_t index) {
    assert(is_array());
    return as_array()[index];
}

bool
Value::contains(const std::string& key) const {
    if (is_table()) {
        return as_table().contains(key);
    }
    return false;
}

bool
Value::is_scalar() const {
    switch (type()) {
        case ValueType::Null:
        case ValueType::Bool:
        case ValueType::Int:
        case ValueType::Float:
        case ValueType::String:
            return true;
        case ValueType::Table:
        case ValueType::Array:
        case ValueType::Invalid:
            return false;
    }
    return false;
}

std::string
kdlgen::type_name(ValueType type) {
    switch (type) {
        case ValueType::Null:
            return "null";
        case ValueType::Bool:
            return "bool";
        case ValueType::Int:
            return "int";
        case ValueType::Float:
            return "float";
        case ValueType::String:
            return "string";
        case ValueType::Table:
            return "table";
        case ValueType::Array:
            return "array";
        case ValueType::Invalid:
            return "invalid";
    }
    return "unknown";
}

std::string
kdlgen::repr(const Value& v) {
    switch (v.type()) {
        case ValueType::Null:
            return "Null";
        case ValueType::Bool:
            return fmt::format("Boolean<{}>", v.as_bool());
        case ValueType::Int:
            return fmt::format("Integer<{}>", v.as_int());
        case ValueType::Float:
            return fmt::format("Float<{}>", v.as_float());
        case ValueType::String:
            return fmt::format("String<'{}'>", v.as_string());
        case ValueType::Table:
            return fmt::format("Table{{{}}}", v.as_table().size());
        case ValueType::Array:
            return fmt::format("Array[{}]", v.as_array().size());
        case ValueType::Invalid:
            return "Invalid";
    }
    return "Unknown";
}

std::string
kdlgen::dump_value_object(const Value& v) {
    std::string result;
    internal::dump_value_object(v, result, 0);
    return result;
}
