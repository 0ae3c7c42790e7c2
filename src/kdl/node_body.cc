#include "node_body.hpp"

#include <fmt/format.h>

using namespace kdlgen;

namespace internal {

static std::string
join_path(const std::string& path, const std::string& key) {
    if (path.empty()) {
        return key;
    }
    return fmt::format("{}.{}", path, key);
}

static bool
extract_args(const Value& value, RenderResult& result, NodeBody& body, const std::string& path) {
    if (!value.is_array()) {
        result.set_error(RenderErrorKind::InvalidReservedKey, path,
                         fmt::format("`{}` must be an array of literals, got {}", kKeyArgs, type_name(value.type())));
        return false;
    }

    auto& array = value.as_array();
    for (std::size_t i = 0; i < array.size(); i++) {
        if (!array[i].is_scalar()) {
            result.set_error(RenderErrorKind::InvalidReservedKey, fmt::format("{}[{}]", path, i),
                             fmt::format("`{}` may only hold literals, got {}", kKeyArgs, repr(array[i])));
            return false;
        }
    }
    body.args = array;
    return true;
}

static bool
extract_props(const Value& value, RenderResult& result, NodeBody& body, const std::string& path) {
    if (!value.is_table()) {
        result.set_error(RenderErrorKind::InvalidReservedKey, path,
                         fmt::format("`{}` must be a table of literals, got {}", kKeyProps, type_name(value.type())));
        return false;
    }

    return value.as_table().for_each_until([&](const std::string& key, const Value& prop) {
        if (!prop.is_scalar()) {
            result.set_error(RenderErrorKind::InvalidReservedKey, join_path(path, key),
                             fmt::format("`{}` may only hold literals, got {}", kKeyProps, repr(prop)));
            return false;
        }
        body.props.insert(key, prop);
        return true;
    });
}

static bool
extract_children(const Value& value, RenderResult& result, NodeBody& body, const std::string& path) {
    if (!value.is_array()) {
        result.set_error(RenderErrorKind::InvalidReservedKey, path,
                         fmt::format("`{}` must be an array of single-entry tables, got {}", kKeyChildren,
                                     type_name(value.type())));
        return false;
    }

    auto& array = value.as_array();
    for (std::size_t i = 0; i < array.size(); i++) {
        auto& child = array[i];
        auto child_path = fmt::format("{}[{}]", path, i);
        if (!child.is_table()) {
            result.set_error(RenderErrorKind::InvalidReservedKey, child_path,
                             fmt::format("`{}` entries must be single-entry tables, got {}", kKeyChildren,
                                         repr(child)));
            return false;
        }

        auto& table = child.as_table();
        if (table.size() != 1) {
            result.set_error(RenderErrorKind::InvalidReservedKey, child_path,
                             fmt::format("`{}` entries must have exactly one key, got {}", kKeyChildren,
                                         table.size()));
            return false;
        }

        auto& name = table.keys().front();
        body.ordered_children.emplace_back(name, table.at(name));
    }
    return true;
}

}  // namespace internal

bool
kdlgen::is_reserved_key(const std::string& key) {
    return key == kKeyArgs || key == kKeyProps || key == kKeyChildren;
}

bool
kdlgen::node_body_from_table(const Value::Table& table,
                             RenderResult& result,
                             NodeBody& body,
                             const std::string& path) {
    body = NodeBody{};

    if (table.contains(kKeyArgs)) {
        if (!internal::extract_args(table.at(kKeyArgs), result, body, internal::join_path(path, kKeyArgs))) {
            return false;
        }
    }

    if (table.contains(kKeyProps)) {
        if (!internal::extract_props(table.at(kKeyProps), result, body, internal::join_path(path, kKeyProps))) {
            return false;
        }
    }

    if (table.contains(kKeyChildren)) {
        if (!internal::extract_children(table.at(kKeyChildren), result, body,
                                        internal::join_path(path, kKeyChildren))) {
            return false;
        }
    }

    table.for_each([&](const std::string& key, const Value& value) {
        if (!is_reserved_key(key)) {
            body.extra.insert(key, value);
        }
    });

    return true;
}
