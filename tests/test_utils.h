#pragma once

#include <gtest/gtest.h>

#include <vshadertest/process.hpp>
#include <vshadertest/result.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace vshadertest_test
{
    // Scoped directory under /tmp, removed with everything inside it.
    class TempDir
    {
    public:
        TempDir()
        {
            char tmpl[] = "/tmp/vshadertest_test_XXXXXX";
            if (::mkdtemp(tmpl) == nullptr)
                ADD_FAILURE() << "mkdtemp failed";
            else
                m_Path = tmpl;
        }

        ~TempDir()
        {
            if (m_Path.empty())
                return;
            std::error_code ec;
            std::filesystem::remove_all(m_Path, ec);
        }

        TempDir(const TempDir&)            = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::string& path() const { return m_Path; }
        std::string        file(const std::string& name) const { return m_Path + "/" + name; }

    private:
        std::string m_Path;
    };

    inline std::string ReadFile(const std::string& path)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f)
            return "";
        std::stringstream buffer;
        buffer << f.rdbuf();
        return buffer.str();
    }

    inline bool WriteFile(const std::string& path, const std::string& content)
    {
        std::error_code ec;
        const auto      parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent, ec);

        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f)
            return false;
        f << content;
        return f.good();
    }

    inline std::vector<std::string> SplitLines(const std::string& text)
    {
        std::vector<std::string> lines;
        std::string              cur;
        for (char c : text)
        {
            if (c == '\n')
            {
                lines.push_back(cur);
                cur.clear();
            }
            else
            {
                cur.push_back(c);
            }
        }
        if (!cur.empty())
            lines.push_back(cur);
        return lines;
    }

    // 2x1 binary pixmap: one red pixel, one blue pixel.
    inline std::string TinyPpm() { return std::string("P6\n2 1\n255\n") + std::string("\xff\x00\x00\x00\x00\xff", 6); }

    // ------------------------------------------------------------
    // FakeProcessRunner
    //
    // Records every command and imitates the two external tools:
    //   glslc    writes "; SPIR-V <stage>\n" followed by stdin to the -o path
    //   vkrunner copies the script it was given into `scripts` and, when
    //            asked for --image, writes `raster` there
    // Any other program, or one listed in `missingPrograms`, fails to spawn.
    // ------------------------------------------------------------
    class FakeProcessRunner final : public vshadertest::ProcessRunner
    {
    public:
        vshadertest::Result<vshadertest::ProcessOutput> run(const vshadertest::ProcessCommand& command) override
        {
            using vshadertest::ErrorCode;
            using vshadertest::ProcessOutput;
            using vshadertest::Result;

            commands.push_back(command);

            if (missingPrograms.count(command.program) != 0)
                return Result<ProcessOutput>::err({ErrorCode::eSpawnError, "No such file or directory"});

            if (command.program == glslcProgram)
                return run_glslc(command);
            if (command.program == vkrunnerProgram)
                return run_vkrunner(command);

            return Result<ProcessOutput>::err({ErrorCode::eSpawnError, "unknown program " + command.program});
        }

        std::string glslcProgram    = "glslc";
        std::string vkrunnerProgram = "vkrunner";

        std::set<std::string> missingPrograms;

        int         glslcExitCode = 0;
        std::string glslcStdout;
        std::string glslcStderr;
        bool        glslcWritesOutput = true;

        int         vkrunnerExitCode = 0;
        std::string vkrunnerStdout   = "PIPELINE CREATION OK\n";
        std::string vkrunnerStderr;
        bool        vkrunnerWritesRaster = true;
        std::string raster               = TinyPpm();

        std::vector<vshadertest::ProcessCommand> commands;
        std::vector<std::string>                 scripts;

        size_t count_program(const std::string& program) const
        {
            size_t n = 0;
            for (const auto& c : commands)
                if (c.program == program)
                    ++n;
            return n;
        }

    private:
        static std::string arg_after(const vshadertest::ProcessCommand& command, const std::string& flag)
        {
            for (size_t i = 0; i + 1 < command.args.size(); ++i)
                if (command.args[i] == flag)
                    return command.args[i + 1];
            return {};
        }

        vshadertest::Result<vshadertest::ProcessOutput> run_glslc(const vshadertest::ProcessCommand& command)
        {
            vshadertest::ProcessOutput out;
            out.exitCode   = glslcExitCode;
            out.stdoutText = glslcStdout;
            out.stderrText = glslcStderr;

            if (glslcExitCode == 0 && glslcWritesOutput)
            {
                std::string stage;
                for (const auto& a : command.args)
                    if (a.rfind("-fshader-stage=", 0) == 0)
                        stage = a.substr(15);

                WriteFile(arg_after(command, "-o"), "; SPIR-V " + stage + "\n" + command.stdinData.value_or(""));
            }

            return vshadertest::Result<vshadertest::ProcessOutput>::ok(std::move(out));
        }

        vshadertest::Result<vshadertest::ProcessOutput> run_vkrunner(const vshadertest::ProcessCommand& command)
        {
            // The script path is the first argument that is neither a flag
            // nor a flag's value.
            std::string script;
            for (size_t i = 0; i < command.args.size(); ++i)
            {
                const std::string& a = command.args[i];
                if (a == "-D" || a == "--image")
                {
                    ++i;
                    continue;
                }
                script = a;
                break;
            }
            scripts.push_back(ReadFile(script));

            const std::string image = arg_after(command, "--image");
            if (!image.empty() && vkrunnerWritesRaster)
                WriteFile(image, raster);

            vshadertest::ProcessOutput out;
            out.exitCode   = vkrunnerExitCode;
            out.stdoutText = vkrunnerStdout;
            out.stderrText = vkrunnerStderr;
            return vshadertest::Result<vshadertest::ProcessOutput>::ok(std::move(out));
        }
    };
} // namespace vshadertest_test
