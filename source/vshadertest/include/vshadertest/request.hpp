#pragma once

#include "vshadertest/compiler.hpp"
#include "vshadertest/pipeline.hpp"
#include "vshadertest/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vshadertest
{
    // ------------------------------------------------------------
    // Shader test request
    //
    // Everything one compile-and-run invocation needs: the stages to
    // compile, the script description referencing their outputs and an
    // optional destination for the rendered image.
    // ------------------------------------------------------------
    struct ShaderTestRequest
    {
        std::vector<CompileRequest> compileRequests;
        ShaderTestSpec              spec;
        std::optional<std::string>  outputPath;
    };

    // JSON wire format:
    //
    //   {
    //     "requests":     [{"stage": "Frag", "source": "...", "tmp_output_path": "frag.spvasm"}],
    //     "requirements": [{"SubgroupSize": 32}, "ShaderFloat64"],          (optional)
    //     "passes":       ["VertPassthrough", {"FragSpirv": {"frag_spvasm_path": "frag.spvasm"}}],
    //     "vertex_data":  [{"AttributeFormat": {"location": 0, "format": "R32G32_SFLOAT"}}], (optional)
    //     "tests":        [{"DrawRect": {"x": -1, "y": -1, "width": 2, "height": 2}}],
    //     "output_path":  "out.png"                                         (optional)
    //   }
    //
    // Unit variants are bare strings (or a single key mapping to null),
    // data variants are objects with exactly one key. Errors name the
    // JSON path of the offending value, e.g. "tests[2].DrawRect.x".
    Result<ShaderTestRequest> parse_request_json(std::string_view text);

    // Compile-only form: just the "requests" array.
    Result<std::vector<CompileRequest>> parse_compile_request_json(std::string_view text);

    Result<std::string> read_request_text(const std::string& path);
} // namespace vshadertest
