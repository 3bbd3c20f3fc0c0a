#pragma once

#include "vshadertest/process.hpp"
#include "vshadertest/result.hpp"
#include "vshadertest/source.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vshadertest
{
    struct RunnerConfig
    {
        std::string executable = "vkrunner";

        // Forwarded as "-D TOKEN=REPLACEMENT"; the engine applies them
        // while reading the script.
        std::vector<TokenReplacement> tokenReplacements;
    };

    // Result of one engine run. A failing test is a normal outcome.
    struct ExecutionOutcome
    {
        int         exitCode = 0;
        bool        passed   = false;
        std::string stdoutText;
        std::string stderrText;
    };

    ProcessCommand make_runner_command(const RunnerConfig&               cfg,
                                       const std::string&                scriptPath,
                                       const std::optional<std::string>& rasterPath);

    // Runs the engine once on `scriptPath`. When `rasterPath` is set the
    // engine is asked to dump the framebuffer there.
    Result<ExecutionOutcome> execute_script(ProcessRunner&                    runner,
                                            const RunnerConfig&               cfg,
                                            const std::string&                scriptPath,
                                            const std::optional<std::string>& rasterPath);
} // namespace vshadertest
