#pragma once

#include "vshadertest/process.hpp"
#include "vshadertest/result.hpp"
#include "vshadertest/scratch.hpp"
#include "vshadertest/types.hpp"

#include <string>
#include <vector>

namespace vshadertest
{
    struct CompilerConfig
    {
        std::string executable = "glslc";

        // Passed as --target-env=<targetEnv>.
        std::string targetEnv = "vulkan1.4";

        bool optimize = true;
    };

    // One shader stage to compile into a SPIR-V assembly file.
    struct CompileRequest
    {
        ShaderStage stage = ShaderStage::eFrag;
        std::string source;
        std::string outputPath; // relative paths are placed under the scratch root
    };

    struct CompiledStage
    {
        ShaderStage stage = ShaderStage::eFrag;
        std::string outputPath; // normalized
        std::string stdoutText;
        std::string stderrText;
    };

    // Builds the compiler command line for one request. The source is
    // read from stdin ("-").
    ProcessCommand make_compile_command(const CompilerConfig& cfg, ShaderStage stage, const std::string& outputPath);

    // Compiles one stage. A non-zero compiler exit is an eCompileError
    // whose message carries both captured streams verbatim.
    Result<CompiledStage> compile_stage(ProcessRunner&        runner,
                                        const ScratchContext& ctx,
                                        const CompileRequest& req,
                                        const CompilerConfig& cfg);

    // Compiles in order and stops at the first failure.
    Result<std::vector<CompiledStage>> compile_stages(ProcessRunner&                     runner,
                                                      const ScratchContext&              ctx,
                                                      const std::vector<CompileRequest>& requests,
                                                      const CompilerConfig&              cfg);
} // namespace vshadertest
