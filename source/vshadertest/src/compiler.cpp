#include "vshadertest/compiler.hpp"

#include <filesystem>
#include <utility>

namespace vshadertest
{
    static std::string format_compile_failure(const ProcessOutput& out)
    {
        std::string msg;
        msg.reserve(out.stdoutText.size() + out.stderrText.size() + 64);
        msg += "Shader compilation failed:\n\nStdout:\n";
        msg += out.stdoutText;
        msg += "\n\nStderr:\n";
        msg += out.stderrText;
        return msg;
    }

    ProcessCommand make_compile_command(const CompilerConfig& cfg, ShaderStage stage, const std::string& outputPath)
    {
        ProcessCommand c;
        c.program = cfg.executable;
        c.args.push_back("--target-env=" + cfg.targetEnv);
        c.args.push_back(std::string("-fshader-stage=") + stage_name(stage));
        if (cfg.optimize)
            c.args.push_back("-O");
        c.args.push_back("-S");
        c.args.push_back("-o");
        c.args.push_back(outputPath);
        c.args.push_back("-");
        return c;
    }

    Result<CompiledStage> compile_stage(ProcessRunner&        runner,
                                        const ScratchContext& ctx,
                                        const CompileRequest& req,
                                        const CompilerConfig& cfg)
    {
        if (req.outputPath.empty())
            return Result<CompiledStage>::err(
                {ErrorCode::eInvalidArgument,
                 std::string("Compile request for stage ") + stage_name(req.stage) + " has no output path."});

        const std::string outputPath = normalize_scratch_path(ctx, req.outputPath);

        auto dir = ensure_parent_directory(outputPath);
        if (!dir.isOk())
            return Result<CompiledStage>::err(
                {ErrorCode::eIO, "Failed to create temporary output directory: " + dir.error().message});

        ProcessCommand command = make_compile_command(cfg, req.stage, outputPath);
        command.stdinData      = req.source;

        auto r = runner.run(command);
        if (!r.isOk())
        {
            Error e = r.error();
            if (e.code == ErrorCode::eSpawnError)
                e.message = "Failed to spawn " + cfg.executable + " process: " + e.message;
            return Result<CompiledStage>::err(std::move(e));
        }

        const ProcessOutput& out = r.value();
        if (!out.success())
            return Result<CompiledStage>::err({ErrorCode::eCompileError, format_compile_failure(out)});

        std::error_code ec;
        if (!std::filesystem::exists(outputPath, ec))
            return Result<CompiledStage>::err(
                {ErrorCode::eCompileError,
                 cfg.executable + " reported success but produced no output at " + outputPath});

        CompiledStage stage;
        stage.stage      = req.stage;
        stage.outputPath = outputPath;
        stage.stdoutText = out.stdoutText;
        stage.stderrText = out.stderrText;
        return Result<CompiledStage>::ok(std::move(stage));
    }

    Result<std::vector<CompiledStage>> compile_stages(ProcessRunner&                     runner,
                                                      const ScratchContext&              ctx,
                                                      const std::vector<CompileRequest>& requests,
                                                      const CompilerConfig&              cfg)
    {
        std::vector<CompiledStage> out;
        out.reserve(requests.size());

        for (const auto& req : requests)
        {
            auto r = compile_stage(runner, ctx, req, cfg);
            if (!r.isOk())
                return Result<std::vector<CompiledStage>>::err(r.error());
            out.push_back(std::move(r.value()));
        }

        return Result<std::vector<CompiledStage>>::ok(std::move(out));
    }
} // namespace vshadertest
