#include "vshadertest/system.hpp"
#include "vshadertest/image.hpp"
#include "vshadertest/script_writer.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace vshadertest
{
    static void append_compile_log(std::string& log, const std::vector<CompiledStage>& stages)
    {
        for (const auto& s : stages)
        {
            log += std::string("Compiled ") + stage_name(s.stage) + " -> " + s.outputPath + "\n";
            if (!s.stderrText.empty())
                log += s.stderrText + (s.stderrText.back() == '\n' ? "" : "\n");
        }
    }

    Result<std::vector<CompiledStage>> compile_shaders(const std::vector<CompileRequest>& requests,
                                                       const ToolchainConfig&             config,
                                                       ProcessRunner&                     runner)
    {
        return compile_stages(runner, config.scratch, requests, config.compiler);
    }

    Result<EmittedScript> emit_script(const ShaderTestRequest& request,
                                      const ToolchainConfig&   config,
                                      ProcessRunner&           runner)
    {
        auto valid = validate_spec(request.spec);
        if (!valid.isOk())
            return Result<EmittedScript>::err(valid.error());

        EmittedScript out;

        auto compiled = compile_stages(runner, config.scratch, request.compileRequests, config.compiler);
        if (!compiled.isOk())
            return Result<EmittedScript>::err(compiled.error());
        out.compiledStages = std::move(compiled.value());
        append_compile_log(out.log, out.compiledStages);

        const ScratchContext& ctx = config.scratch;

        auto script = serialize_script(request.spec,
                                       [&ctx](const std::string& p) { return normalize_scratch_path(ctx, p); });
        if (!script.isOk())
            return Result<EmittedScript>::err(script.error());

        out.scriptPath = ctx.scriptPath();
        out.scriptText = std::move(script.value());

        auto w = write_script_file(out.scriptPath, out.scriptText);
        if (!w.isOk())
            return Result<EmittedScript>::err(w.error());
        out.log += "Wrote " + out.scriptPath + "\n";

        return Result<EmittedScript>::ok(std::move(out));
    }

    Result<ShaderTestReport> run_shader_test(const ShaderTestRequest& request,
                                             const ToolchainConfig&   config,
                                             ProcessRunner&           runner)
    {
        auto emitted = emit_script(request, config, runner);
        if (!emitted.isOk())
            return Result<ShaderTestReport>::err(emitted.error());

        ShaderTestReport report;
        report.compiledStages = std::move(emitted.value().compiledStages);
        report.scriptPath     = std::move(emitted.value().scriptPath);
        report.scriptText     = std::move(emitted.value().scriptText);
        report.log            = std::move(emitted.value().log);
        report.outputPath     = request.outputPath;

        std::optional<std::string> rasterPath;
        if (request.outputPath)
        {
            rasterPath = config.scratch.rasterPath();

            // A raster left over from an earlier run must not be mistaken
            // for this run's output.
            std::error_code ec;
            std::filesystem::remove(*rasterPath, ec);
            if (ec)
                report.log += "Could not remove stale raster " + *rasterPath + ": " + ec.message() + "\n";
        }

        const ProcessCommand engineCommand = make_runner_command(config.runner, report.scriptPath, rasterPath);
        report.log += "Running " + format_command_line(engineCommand) + "\n";

        auto outcome = execute_script(runner, config.runner, report.scriptPath, rasterPath);
        if (!outcome.isOk())
            return Result<ShaderTestReport>::err(outcome.error());
        report.outcome = std::move(outcome.value());

        report.log += std::string("Engine ") + (report.outcome.passed ? "passed" : "failed") + " (exit code " +
                      std::to_string(report.outcome.exitCode) + ")\n";

        if (!request.outputPath || !report.outcome.passed)
            return Result<ShaderTestReport>::ok(std::move(report));

        std::error_code ec;
        if (!std::filesystem::exists(*rasterPath, ec))
        {
            report.imageStatus  = ImageStatus::eNotGenerated;
            report.imageMessage = "No output image was generated by VkRunner.";
            report.log += report.imageMessage + "\n";
            return Result<ShaderTestReport>::ok(std::move(report));
        }

        auto img = normalize_image(*rasterPath, *request.outputPath);
        if (img.isOk())
        {
            report.imageStatus  = ImageStatus::eSaved;
            report.imageMessage = "Image saved to: " + *request.outputPath;
        }
        else
        {
            report.imageStatus  = ImageStatus::eConversionFailed;
            report.imageMessage = "Failed to convert output image: " + img.error().message;
        }
        report.log += report.imageMessage + "\n";

        return Result<ShaderTestReport>::ok(std::move(report));
    }

    std::string format_report(const ShaderTestReport& report)
    {
        std::string out;

        if (report.outcome.passed)
        {
            out += "VkRunner execution successful.\n\nOutput:\n";
            out += report.outcome.stdoutText;
            out += "\n\n";
        }
        else
        {
            out += "VkRunner execution failed.\n\nOutput:\n";
            out += report.outcome.stdoutText;
            out += "\n\nError:\n";
            out += report.outcome.stderrText;
            out += "\n\n";
        }

        if (report.imageStatus != ImageStatus::eNotRequested)
        {
            out += report.imageMessage;
            out += "\n";
        }

        out += "\nShader Test File Contents:\n";
        out += report.scriptText;
        return out;
    }
} // namespace vshadertest
