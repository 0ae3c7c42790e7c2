#include "kdl_serializer.hpp"

#include "literal.hpp"

#include <fmt/format.h>

#include <algorithm>

#ifndef KDLGEN_TRACE_ENABLE
#define KDLGEN_TRACE_ENABLE 0
#endif

#define TRACE(...)               \
    if (KDLGEN_TRACE_ENABLE) {   \
        fmt::print(__VA_ARGS__); \
    }

using namespace kdlgen;

namespace internal {

static std::string
join_path(const std::string& path, const std::string& key) {
    if (path.empty()) {
        return key;
    }
    return fmt::format("{}.{}", path, key);
}

// Accumulates lines. Every line is prefixed with the indentation of the
// current depth; lines are separated, not terminated, by newlines.
class KdlWriter {
  public:
    explicit KdlWriter(const RenderOptions& options)
        : options_(options) {}

    void
    begin_line() {
        if (!output_.empty()) {
            output_ += '\n';
        }
        write_indent();
    }

    // Newlines inside `s` (i.e from a node name) start indented lines too.
    void
    write(const std::string& s) {
        for (char c : s) {
            output_ += c;
            if (c == '\n') {
                write_indent();
            }
        }
    }

    void
    indent() {
        depth_++;
    }

    void
    dedent() {
        depth_--;
    }

    int
    depth() const {
        return depth_;
    }

    std::string&
    str() {
        return output_;
    }

  private:
    void
    write_indent() {
        for (int i = 0; i < depth_; i++) {
            output_ += options_.indent;
        }
    }

    const RenderOptions& options_;
    std::string output_;
    int depth_ = 0;
};

class Serializer {
  public:
    Serializer(const RenderOptions& options, RenderResult& result)
        : writer_(options)
        , result_(result) {}

    bool
    attribute(const std::string& name, const Value& value, const std::string& path) {
        auto kind = classify_attribute(value);
        TRACE("{:>2} {} {} -> {}\n", writer_.depth(), path, repr(value), repr(kind));

        switch (kind) {
            case AttributeKind::Literal: {
                std::string literal;
                if (!encode_literal(value, result_, literal, path)) {
                    return false;
                }
                writer_.begin_line();
                writer_.write(fmt::format("{} {}", name, literal));
            } break;
            case AttributeKind::Node: {
                NodeBody body;
                if (!node_body_from_table(value.as_table(), result_, body, path)) {
                    return false;
                }
                return node(name, body, path);
            }
            case AttributeKind::FlatList: {
                std::string line = name;
                auto& array = value.as_array();
                for (std::size_t i = 0; i < array.size(); i++) {
                    std::string literal;
                    if (!encode_literal(array[i], result_, literal, fmt::format("{}[{}]", path, i))) {
                        return false;
                    }
                    line += " " + literal;
                }
                writer_.begin_line();
                writer_.write(line);
            } break;
            case AttributeKind::NodeList: {
                auto& array = value.as_array();
                for (std::size_t i = 0; i < array.size(); i++) {
                    if (!attribute(name, array[i], fmt::format("{}[{}]", path, i))) {
                        return false;
                    }
                }
            } break;
            case AttributeKind::Unsupported: {
                result_.set_error(RenderErrorKind::UnsupportedAttributeType, path,
                                  fmt::format("Cannot convert type `{}` to KDL: {} = {}", type_name(value.type()),
                                              name, repr(value)));
                return false;
            }
        }
        return true;
    }

    bool
    node(const std::string& name, const NodeBody& body, const std::string& path) {
        std::string header = name;

        for (std::size_t i = 0; i < body.args.size(); i++) {
            std::string literal;
            if (!encode_literal(body.args[i], result_, literal, fmt::format("{}.{}[{}]", path, kKeyArgs, i))) {
                return false;
            }
            header += " " + literal;
        }

        bool props_ok = body.props.for_each_until([&](const std::string& key, const Value& value) {
            std::string literal;
            if (!encode_literal(value, result_, literal, join_path(join_path(path, kKeyProps), key))) {
                return false;
            }
            header += fmt::format(" {}={}", key, literal);
            return true;
        });
        if (!props_ok) {
            return false;
        }

        writer_.begin_line();
        writer_.write(header);

        if (!body.has_children()) {
            return true;
        }

        writer_.write(" {");
        writer_.indent();

        for (std::size_t i = 0; i < body.ordered_children.size(); i++) {
            auto& [child_name, child_value] = body.ordered_children[i];
            auto child_path = fmt::format("{}.{}[{}].{}", path, kKeyChildren, i, child_name);
            if (!attribute(child_name, child_value, child_path)) {
                return false;
            }
        }

        bool extra_ok = body.extra.for_each_until([&](const std::string& key, const Value& value) {
            return attribute(key, value, join_path(path, key));
        });
        if (!extra_ok) {
            return false;
        }

        writer_.dedent();
        writer_.begin_line();
        writer_.write("}");
        return true;
    }

    std::string&
    str() {
        return writer_.str();
    }

  private:
    KdlWriter writer_;
    RenderResult& result_;
};

}  // namespace internal

bool
kdlgen::is_flat_array(const Value::Array& array) {
    return std::none_of(array.begin(), array.end(), [](const Value& v) { return v.is_table() || v.is_array(); });
}

AttributeKind
kdlgen::classify_attribute(const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
        case ValueType::Bool:
        case ValueType::Int:
        case ValueType::Float:
        case ValueType::String:
            return AttributeKind::Literal;
        case ValueType::Table:
            return AttributeKind::Node;
        case ValueType::Array:
            return is_flat_array(value.as_array()) ? AttributeKind::FlatList : AttributeKind::NodeList;
        case ValueType::Invalid:
            return AttributeKind::Unsupported;
    }
    return AttributeKind::Unsupported;
}

std::string
kdlgen::repr(AttributeKind kind) {
    switch (kind) {
        case AttributeKind::Literal:
            return "Literal";
        case AttributeKind::Node:
            return "Node";
        case AttributeKind::FlatList:
            return "FlatList";
        case AttributeKind::NodeList:
            return "NodeList";
        case AttributeKind::Unsupported:
            return "Unsupported";
    }
    return "Unknown";
}

bool
kdlgen::kdl_serialize(const Value::Table& root,
                      RenderResult& result,
                      std::string& output,
                      const RenderOptions& options) {
    output.clear();
    result = RenderResult{};

    internal::Serializer serializer(options, result);
    bool ok = root.for_each_until([&](const std::string& key, const Value& value) {
        return serializer.attribute(key, value, key);
    });
    if (!ok) {
        return false;
    }

    output = std::move(serializer.str());
    if (options.trailing_newline) {
        output += "\n";
    }
    return true;
}

bool
kdlgen::kdl_serialize(const Value& root, RenderResult& result, std::string& output, const RenderOptions& options) {
    if (!root.is_table()) {
        output.clear();
        result.set_error(RenderErrorKind::UnsupportedAttributeType, "",
                         fmt::format("Document root must be a table, got {}", repr(root)));
        return false;
    }
    return kdl_serialize(root.as_table(), result, output, options);
}

bool
kdlgen::kdl_serialize_attribute(const std::string& name,
                                const Value& value,
                                RenderResult& result,
                                std::string& output,
                                const RenderOptions& options) {
    output.clear();
    result = RenderResult{};

    internal::Serializer serializer(options, result);
    if (!serializer.attribute(name, value, name)) {
        return false;
    }
    output = std::move(serializer.str());
    return true;
}

bool
kdlgen::kdl_serialize_node(const std::string& name,
                           const Value::Table& body,
                           RenderResult& result,
                           std::string& output,
                           const RenderOptions& options) {
    output.clear();
    result = RenderResult{};

    NodeBody node_body;
    if (!node_body_from_table(body, result, node_body, name)) {
        return false;
    }

    internal::Serializer serializer(options, result);
    if (!serializer.node(name, node_body, name)) {
        return false;
    }
    output = std::move(serializer.str());
    return true;
}
