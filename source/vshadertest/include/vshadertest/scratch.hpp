#pragma once

#include "vshadertest/result.hpp"

#include <string>
#include <string_view>

namespace vshadertest
{
    // ------------------------------------------------------------
    // Scratch context
    //
    // Every intermediate file of one request (compiled stages, the
    // generated script, the captured raster) lives under one root.
    // The context is passed explicitly through each stage so that
    // concurrent requests can each own a separate root.
    // ------------------------------------------------------------
    struct ScratchContext
    {
        std::string root       = "/tmp";
        std::string scriptName = "vkrunner_test.shader_test";
        std::string rasterName = "vkrunner_output.ppm";

        std::string scriptPath() const;
        std::string rasterPath() const;
    };

    // Paths that already start with the scratch root are returned
    // unchanged; everything else is placed under it. Idempotent.
    std::string normalize_scratch_path(const ScratchContext& ctx, std::string_view path);

    // Creates the parent directory of `path` if it does not exist yet.
    Result<void> ensure_parent_directory(const std::string& path);

    // Derives a request-local root below `base.root` from the request
    // contents, the process id and a process-wide counter.
    ScratchContext make_unique_scratch(const ScratchContext& base, std::string_view requestText);
} // namespace vshadertest
