#pragma once

#include "kdl/kdl_serializer.hpp"
#include "kdl/render_result.hpp"
#include "value/value.hpp"

#include <string>

namespace kdlgen {

struct OutputOptions {
    // Empty means config_default_path()
    std::string path;

    // Raw lines appended after the generated document, unprocessed
    std::string trailer;

    bool create_directories = true;

    RenderOptions render;
};

// `<config home>/niri/config.kdl`
std::string
config_default_path();

// The generated document, a newline and then the trailer.
bool
config_compose(const Value::Table& root,
               const std::string& trailer,
               RenderResult& result,
               std::string& output,
               const RenderOptions& options = {});

// Compose and write the config file. Nothing is written if the document
// can't be rendered.
bool
config_write(const Value::Table& root, const OutputOptions& options, RenderResult& result);

}  // namespace kdlgen
