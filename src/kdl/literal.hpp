#pragma once

#include "render_result.hpp"
#include "value/value.hpp"

#include <string>

namespace kdlgen {

// KDL tokens for the scalar values
inline const std::string kKdlNull = "null";
inline const std::string kKdlTrue = "true";
inline const std::string kKdlFalse = "false";

// Quote a string and escape newlines and double quotes. Nothing else
// is escaped.
std::string
kdl_quote_string(const std::string& s);

// Render a scalar (null, bool, int, float, string) as a KDL literal.
//
// Tables, arrays and non-finite floats have no literal form and fail with
// RenderErrorKind::UnsupportedLiteralType. `path` is only used for the error
// report.
bool
encode_literal(const Value& value, RenderResult& result, std::string& literal, const std::string& path = "");

}  // namespace kdlgen
