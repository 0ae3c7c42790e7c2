#pragma once

#include <string>

namespace kdlgen {

// clang-format off
enum class RenderErrorKind {
    None                     = 1 << 0,
    UnsupportedLiteralType   = 1 << 1, // A scalar position holds a table, array or non-finite float
    UnsupportedAttributeType = 1 << 2, // No classification rule for the value
    InvalidReservedKey       = 1 << 3, // `_args`, `_props` or `_children` has the wrong shape
    File                     = 1 << 4, // Writing the config file failed
};
// clang-format on

struct RenderResult {
    RenderErrorKind kind = RenderErrorKind::None;
    std::string error;

    // Dotted location of the offending attribute; i.e `binds.Mod+T._args[1]`
    std::string path;

    bool
    is_ok() const {
        return kind == RenderErrorKind::None;
    }

    void
    set_error(RenderErrorKind error_kind, const std::string& error_path, std::string error_message);

    // "<kind> at '<path>': <error>"
    std::string
    describe() const;
};

std::string
repr(RenderErrorKind kind);

}  // namespace kdlgen
