#include "vshadertest/runner.hpp"

#include <utility>

namespace vshadertest
{
    ProcessCommand make_runner_command(const RunnerConfig&               cfg,
                                       const std::string&                scriptPath,
                                       const std::optional<std::string>& rasterPath)
    {
        ProcessCommand c;
        c.program = cfg.executable;

        for (const auto& tr : cfg.tokenReplacements)
        {
            c.args.push_back("-D");
            c.args.push_back(tr.token + "=" + tr.replacement);
        }

        c.args.push_back(scriptPath);

        if (rasterPath)
        {
            c.args.push_back("--image");
            c.args.push_back(*rasterPath);
        }

        return c;
    }

    Result<ExecutionOutcome> execute_script(ProcessRunner&                    runner,
                                            const RunnerConfig&               cfg,
                                            const std::string&                scriptPath,
                                            const std::optional<std::string>& rasterPath)
    {
        for (const auto& tr : cfg.tokenReplacements)
        {
            if (tr.token.empty())
                return Result<ExecutionOutcome>::err(
                    {ErrorCode::eInvalidArgument, "Token replacement with an empty token."});
            if (tr.token.find('=') != std::string::npos)
                return Result<ExecutionOutcome>::err(
                    {ErrorCode::eInvalidArgument, "Token '" + tr.token + "' must not contain '='."});
        }

        auto r = runner.run(make_runner_command(cfg, scriptPath, rasterPath));
        if (!r.isOk())
        {
            Error e = r.error();
            if (e.code == ErrorCode::eSpawnError)
                e.message = "Failed to run " + cfg.executable + ": " + e.message;
            return Result<ExecutionOutcome>::err(std::move(e));
        }

        ExecutionOutcome outcome;
        outcome.exitCode   = r.value().exitCode;
        outcome.passed     = r.value().success();
        outcome.stdoutText = std::move(r.value().stdoutText);
        outcome.stderrText = std::move(r.value().stderrText);
        return Result<ExecutionOutcome>::ok(std::move(outcome));
    }
} // namespace vshadertest
