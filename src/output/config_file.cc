#include "config_file.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

using namespace kdlgen;

std::string
kdlgen::config_default_path() {
    return fmt::format("{}/niri/config.kdl", sago::getConfigHome());
}

bool
kdlgen::config_compose(const Value::Table& root,
                       const std::string& trailer,
                       RenderResult& result,
                       std::string& output,
                       const RenderOptions& options) {
    if (!kdl_serialize(root, result, output, options)) {
        return false;
    }
    output += "\n" + trailer;
    return true;
}

bool
kdlgen::config_write(const Value::Table& root, const OutputOptions& options, RenderResult& result) {
    result = RenderResult{};
    const std::string config_path = options.path.empty() ? config_default_path() : options.path;

    std::string serialized;
    if (!config_compose(root, options.trailer, result, serialized, options.render)) {
        fmt::print(stderr, "error: {}\n\twhile generating: {}\n", result.describe(), config_path);
        return false;
    }

    auto config_root = fs::path(config_path).parent_path();
    if (options.create_directories && !config_root.empty()) {
        std::error_code ec;
        fs::create_directories(config_root, ec);
        if (ec) {
            result.set_error(RenderErrorKind::File, config_path,
                             fmt::format("Failed to create '{}': {}", config_root.string(), ec.message()));
            fmt::print(stderr, "error: {}\n", result.describe());
            return false;
        }
    }

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        result.set_error(RenderErrorKind::File, config_path,
                         fmt::format("Failed to open for writing: errno ({}) = {}", errno, strerror(errno)));
        fmt::print(stderr, "error: {}\n", result.describe());
        return false;
    }

    bool written = fwrite(serialized.data(), 1, serialized.size(), f) == serialized.size();
    if (fclose(f) != 0) {
        written = false;
    }
    if (!written) {
        result.set_error(RenderErrorKind::File, config_path,
                         fmt::format("Failed to write: errno ({}) = {}", errno, strerror(errno)));
        fmt::print(stderr, "error: {}\n", result.describe());
        return false;
    }

    return true;
}
