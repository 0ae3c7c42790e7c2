#include "literal.hpp"

#include <fmt/format.h>

#include <cmath>

using namespace kdlgen;

namespace internal {

// `fmt` prints whole floats without a fraction; keep them from reading
// back as integers.
static std::string
format_float(double f) {
    std::string s = fmt::format("{}", f);
    if (s.find_first_of(".eE") == std::string::npos) {
        s += ".0";
    }
    return s;
}

}  // namespace internal

std::string
kdlgen::kdl_quote_string(const std::string& s) {
    std::string quoted;
    quoted.reserve(s.size() + 2);
    quoted += '"';
    for (char c : s) {
        switch (c) {
            case '\n':
                quoted += "\\n";
                break;
            case '"':
                quoted += "\\\"";
                break;
            default:
                quoted += c;
                break;
        }
    }
    quoted += '"';
    return quoted;
}

bool
kdlgen::encode_literal(const Value& value, RenderResult& result, std::string& literal, const std::string& path) {
    switch (value.type()) {
        case ValueType::Null: {
            literal = kKdlNull;
        } break;
        case ValueType::Bool: {
            literal = value.as_bool() ? kKdlTrue : kKdlFalse;
        } break;
        case ValueType::Int: {
            literal = fmt::format("{}", value.as_int());
        } break;
        case ValueType::Float: {
            if (!std::isfinite(value.as_float())) {
                result.set_error(RenderErrorKind::UnsupportedLiteralType, path,
                                 fmt::format("Cannot convert non-finite value {} to a KDL literal", repr(value)));
                return false;
            }
            literal = internal::format_float(value.as_float());
        } break;
        case ValueType::String: {
            literal = kdl_quote_string(value.as_string());
        } break;
        case ValueType::Table:
        case ValueType::Array:
        case ValueType::Invalid: {
            result.set_error(RenderErrorKind::UnsupportedLiteralType, path,
                             fmt::format("Cannot convert value of type {} to a KDL literal: {}",
                                         type_name(value.type()), repr(value)));
            return false;
        }
    }
    return true;
}
