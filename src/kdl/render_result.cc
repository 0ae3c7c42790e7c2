#include "render_result.hpp"

#include <fmt/format.h>

#include <tuple>
#include <vector>

using namespace kdlgen;

void
RenderResult::set_error(RenderErrorKind error_kind, const std::string& error_path, std::string error_message) {
    kind = error_kind;
    path = error_path;
    error = std::move(error_message);
}

std::string
RenderResult::describe() const {
    if (is_ok()) {
        return repr(kind);
    }
    if (path.empty()) {
        return fmt::format("{}: {}", repr(kind), error);
    }
    return fmt::format("{} at '{}': {}", repr(kind), path, error);
}

std::string
kdlgen::repr(RenderErrorKind kind) {
    std::vector<std::tuple<RenderErrorKind, std::string>> lut = {
        {RenderErrorKind::None, "None"},
        {RenderErrorKind::UnsupportedLiteralType, "UnsupportedLiteralType"},
        {RenderErrorKind::UnsupportedAttributeType, "UnsupportedAttributeType"},
        {RenderErrorKind::InvalidReservedKey, "InvalidReservedKey"},
        {RenderErrorKind::File, "File"},
    };

    for (const auto& [k, name] : lut) {
        if (k == kind) {
            return name;
        }
    }
    return "Unknown";
}
