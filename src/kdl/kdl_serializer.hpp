#pragma once

#include "node_body.hpp"
#include "render_result.hpp"
#include "value/value.hpp"

#include <string>

namespace kdlgen {

/**

 KDL serializer

 Turns a value tree into a KDL document. Each entry of the root table becomes
 a top level node. The encoding of an entry depends on its value:

    layout = "us"               ->  layout "us"

    keyboard = {                ->  keyboard {
        layout = "us"                   layout "us"
    }                               }

    spawn = ["foot", "-e"]      ->  spawn "foot" "-e"

    output = [                  ->  output {
        { name = "DP-1" }               name "DP-1"
        { name = "DP-2" }           }
    ]                               output {
                                        name "DP-2"
                                    }

 Inside a table, the reserved keys `_args`, `_props` and `_children` hold the
 positional arguments, the properties and the explicitly ordered children of
 the node (see node_body.hpp).

 Rendering never produces partial output; on error the output string is left
 empty and `result` describes the first offending value.
*/

struct RenderOptions {
    // Added once per nesting level
    std::string indent = "\t";
    bool trailing_newline = true;
};

enum class AttributeKind {
    Literal,   // name literal
    Node,      // name args... props... { children }
    FlatList,  // name literal1 literal2 ...
    NodeList,  // one sibling per element, each classified on its own
    Unsupported,
};

// True if no element is a table or an array. Empty arrays are flat.
bool
is_flat_array(const Value::Array& array);

AttributeKind
classify_attribute(const Value& value);

std::string
repr(AttributeKind kind);

// Serialize a whole document. `output` ends with a newline; an empty root
// gives a single newline.
bool
kdl_serialize(const Value::Table& root, RenderResult& result, std::string& output, const RenderOptions& options = {});

// Same as above; `root` must hold a table.
bool
kdl_serialize(const Value& root, RenderResult& result, std::string& output, const RenderOptions& options = {});

// Serialize a single named value as one or more lines, without a trailing
// newline.
bool
kdl_serialize_attribute(const std::string& name,
                        const Value& value,
                        RenderResult& result,
                        std::string& output,
                        const RenderOptions& options = {});

// Serialize a table as the body of the node `name`.
bool
kdl_serialize_node(const std::string& name,
                   const Value::Table& body,
                   RenderResult& result,
                   std::string& output,
                   const RenderOptions& options = {});

}  // namespace kdlgen
