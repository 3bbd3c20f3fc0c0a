#pragma once

#include "vshadertest/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vshadertest
{
    struct ProcessCommand
    {
        std::string              program;
        std::vector<std::string> args;

        // When set, written to the child's stdin which is then closed.
        // When unset, the child gets an empty stdin.
        std::optional<std::string> stdinData;
    };

    struct ProcessOutput
    {
        int         exitCode = 0;
        std::string stdoutText;
        std::string stderrText;

        bool success() const { return exitCode == 0; }
    };

    // ------------------------------------------------------------
    // Process runner
    //
    // Spawns a program, feeds stdin, captures both output streams and
    // blocks until it exits. Failing to start the program is an error
    // (eSpawnError); a non-zero exit status is not.
    // ------------------------------------------------------------
    class ProcessRunner
    {
    public:
        virtual ~ProcessRunner() = default;

        virtual Result<ProcessOutput> run(const ProcessCommand& command) = 0;
    };

    // fork/exec implementation with pipes for all three standard streams.
    class PosixProcessRunner final : public ProcessRunner
    {
    public:
        Result<ProcessOutput> run(const ProcessCommand& command) override;
    };

    // Renders a command as a shell-like string for logs.
    std::string format_command_line(const ProcessCommand& command);
} // namespace vshadertest
