#pragma once

#include "vshadertest/compiler.hpp"
#include "vshadertest/process.hpp"
#include "vshadertest/request.hpp"
#include "vshadertest/result.hpp"
#include "vshadertest/runner.hpp"
#include "vshadertest/scratch.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vshadertest
{
    struct ToolchainConfig
    {
        CompilerConfig compiler;
        RunnerConfig   runner;
        ScratchContext scratch;
    };

    enum class ImageStatus : uint8_t
    {
        eNotRequested = 0, // request had no output path
        eSaved,
        eNotGenerated,     // run passed but the engine left no raster behind
        eConversionFailed  // raster present but could not be decoded or stored
    };

    struct ShaderTestReport
    {
        std::vector<CompiledStage> compiledStages;
        ExecutionOutcome           outcome;

        std::string scriptPath;
        std::string scriptText;

        ImageStatus                imageStatus = ImageStatus::eNotRequested;
        std::optional<std::string> outputPath;
        std::string                imageMessage;

        std::string log;
    };

    struct EmittedScript
    {
        std::vector<CompiledStage> compiledStages;
        std::string                scriptPath;
        std::string                scriptText;
        std::string                log;
    };

    // Compile-only entry point.
    Result<std::vector<CompiledStage>> compile_shaders(const std::vector<CompileRequest>& requests,
                                                       const ToolchainConfig&             config,
                                                       ProcessRunner&                     runner);

    // Compiles every stage and writes the script without running it.
    Result<EmittedScript> emit_script(const ShaderTestRequest& request,
                                      const ToolchainConfig&   config,
                                      ProcessRunner&           runner);

    // Full pipeline: compile, serialize, execute, then convert the raster
    // when the request names an output image and the run passed.
    //
    // Errors are reserved for failures before the engine ran (invalid
    // request, compile failure, script I/O, spawn failure). A failing test
    // or an image that cannot be converted is reported, not returned as
    // an error.
    Result<ShaderTestReport> run_shader_test(const ShaderTestRequest& request,
                                             const ToolchainConfig&   config,
                                             ProcessRunner&           runner);

    // Human readable summary: engine outcome and output, the image line
    // and the script that was run.
    std::string format_report(const ShaderTestReport& report);
} // namespace vshadertest
