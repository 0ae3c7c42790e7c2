#pragma once

#include "render_result.hpp"
#include "value/value.hpp"

#include <string>
#include <utility>
#include <vector>

namespace kdlgen {

// Reserved table keys that map onto node parts instead of child nodes
inline const std::string kKeyArgs = "_args";
inline const std::string kKeyProps = "_props";
inline const std::string kKeyChildren = "_children";

bool
is_reserved_key(const std::string& key);

// A table seen as the body of a KDL node:
//
//    name arg1 arg2 prop=value {
//        <ordered_children>
//        <extra>
//    }
//
// `args` and `props` only ever hold scalars. Ordered children are emitted
// before the children derived from `extra`.
struct NodeBody {
    Value::Array args;
    OrderedMap<std::string, Value> props;
    std::vector<std::pair<std::string, Value>> ordered_children;
    Value::Table extra;

    bool
    has_children() const {
        return !ordered_children.empty() || !extra.empty();
    }
};

// Split a table into its node parts, validating the reserved keys:
//
//    _args       array of scalars
//    _props      table of scalars
//    _children   array of tables with exactly one entry each
//
// Any other shape fails with RenderErrorKind::InvalidReservedKey. `path` is
// the location of `table` and is only used for error reports.
bool
node_body_from_table(const Value::Table& table, RenderResult& result, NodeBody& body, const std::string& path = "");

}  // namespace kdlgen
