#include <vshadertest/line_reader.hpp>
#include <vshadertest/process.hpp>
#include <vshadertest/request.hpp>
#include <vshadertest/result.hpp>
#include <vshadertest/scratch.hpp>
#include <vshadertest/source.hpp>
#include <vshadertest/system.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace vshadertest;

// ============================================================
// Logging
// ============================================================

static bool g_verbose = false;

static void log_info(const std::string& s) { std::cout << "[vshaderrun] " << s << std::endl; }

static void log_verbose(const std::string& s)
{
    if (g_verbose)
        std::cout << "[vshaderrun][verbose] " << s << std::endl;
}

static void log_error(const std::string& s) { std::cerr << "[vshaderrun][error] " << s << std::endl; }

// Library logs are multi-line; print them one verbose line at a time.
static void log_verbose_lines(const std::string& text)
{
    std::istringstream in(text);
    std::string        line;
    while (std::getline(in, line))
        log_verbose(line);
}

// ============================================================
// Usage
// ============================================================

static void print_usage()
{
    std::cout <<
        R"(vshaderrun - compile GLSL stages and run them through vkrunner

Usage:
  vshaderrun run -r <request.json> [-o <image>] [options]
  vshaderrun compile -r <request.json> [options]
  vshaderrun emit -r <request.json> [-o <script.shader_test>] [options]
  vshaderrun preprocess -i <script.shader_test> [-D <TOKEN=REPLACEMENT>]...

Options (run, compile, emit):
  --glslc <path>           Compiler executable (default: $VSHADERTEST_GLSLC or glslc)
  --vkrunner <path>        Engine executable (default: $VSHADERTEST_VKRUNNER or vkrunner)
  --target-env <env>       Compiler target environment (default: vulkan1.4)
  --no-optimize            Do not pass -O to the compiler
  --scratch <dir>          Root for intermediate files (default: /tmp)
  --unique-scratch         Use a per-request directory below the scratch root
  -D <TOKEN=REPLACEMENT>   Token replacement forwarded to the engine (repeatable)
  --work-dir <dir>         Change the working directory first
  --verbose                Verbose logging

Exit codes:
  0 success (run: test passed)   1 run: test failed   2 usage
  3 request error                4 compile error      5 pipeline error

Examples:
  vshaderrun run -r examples/requests/gradient.json -o out/gradient.png --verbose
  vshaderrun emit -r examples/requests/compute_ssbo.json -o out/compute.shader_test
  vshaderrun preprocess -i out/compute.shader_test -D SIZE=64
)";
}

// ============================================================
// Common options
// ============================================================

struct CommonOptions
{
    ToolchainConfig config;
    std::string     requestPath;
    std::string     outPath;
    std::string     workDir;
    bool            uniqueScratch = false;
};

static bool parse_token_replacement(const std::string& s, TokenReplacement& out)
{
    const auto pos = s.find('=');
    if (pos == std::string::npos || pos == 0)
        return false;
    out.token       = s.substr(0, pos);
    out.replacement = s.substr(pos + 1);
    return true;
}

static void apply_environment(ToolchainConfig& config)
{
    if (const char* glslc = std::getenv("VSHADERTEST_GLSLC"))
        if (*glslc)
            config.compiler.executable = glslc;
    if (const char* vkrunner = std::getenv("VSHADERTEST_VKRUNNER"))
        if (*vkrunner)
            config.runner.executable = vkrunner;
}

// Returns 0 to continue, -1 when help was printed, otherwise an exit code.
static int parse_common_options(int argc, char** argv, const char* command, CommonOptions& opts)
{
    apply_environment(opts.config);

    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage();
            return -1;
        }
        else if ((a == "-r" || a == "--request") && i + 1 < argc)
        {
            opts.requestPath = argv[++i];
        }
        else if (a == "-o" && i + 1 < argc)
        {
            opts.outPath = argv[++i];
        }
        else if (a == "--glslc" && i + 1 < argc)
        {
            opts.config.compiler.executable = argv[++i];
        }
        else if (a == "--vkrunner" && i + 1 < argc)
        {
            opts.config.runner.executable = argv[++i];
        }
        else if (a == "--target-env" && i + 1 < argc)
        {
            opts.config.compiler.targetEnv = argv[++i];
        }
        else if (a == "--no-optimize")
        {
            opts.config.compiler.optimize = false;
        }
        else if (a == "--scratch" && i + 1 < argc)
        {
            opts.config.scratch.root = argv[++i];
        }
        else if (a == "--unique-scratch")
        {
            opts.uniqueScratch = true;
        }
        else if (a == "-D" && i + 1 < argc)
        {
            TokenReplacement tr;
            if (!parse_token_replacement(argv[++i], tr))
            {
                log_error(std::string(command) + ": -D expects TOKEN=REPLACEMENT, got: " + argv[i]);
                return 2;
            }
            opts.config.runner.tokenReplacements.push_back(std::move(tr));
        }
        else if (a == "--work-dir" && i + 1 < argc)
        {
            opts.workDir = argv[++i];
        }
        else if (a == "--verbose")
        {
            g_verbose = true;
        }
        else
        {
            log_error(std::string("Unknown ") + command + " argument: " + a);
            print_usage();
            return 2;
        }
    }

    if (!opts.workDir.empty())
    {
        std::error_code ec;
        std::filesystem::current_path(opts.workDir, ec);
        if (ec)
        {
            log_error("Failed to set working directory to " + opts.workDir + ": " + ec.message());
            return 2;
        }
        log_verbose("Working directory: " + opts.workDir);
    }

    if (opts.requestPath.empty())
    {
        log_error(std::string(command) + ": request must be specified (-r)");
        return 2;
    }

    return 0;
}

// Reads the request text and, with --unique-scratch, moves the scratch
// root to a directory derived from it.
static int load_request_text(CommonOptions& opts, std::string& text)
{
    auto r = read_request_text(opts.requestPath);
    if (!r.isOk())
    {
        log_error(r.error().message);
        return 3;
    }
    text = std::move(r.value());

    if (opts.uniqueScratch)
        opts.config.scratch = make_unique_scratch(opts.config.scratch, text);

    log_verbose("Scratch root: " + opts.config.scratch.root);
    return 0;
}

static int exit_code_for(const Error& e)
{
    switch (e.code)
    {
        case ErrorCode::eParseError:
        case ErrorCode::eInvalidArgument:
            return 3;
        case ErrorCode::eCompileError:
            return 4;
        default:
            return 5;
    }
}

static void report_error(const char* command, const Error& e)
{
    log_error(std::string(command) + " failed (" + error_code_name(e.code) + "): " + e.message);
}

// ============================================================
// Commands
// ============================================================

static int cmd_run(int argc, char** argv)
{
    // vshaderrun run -r <request.json> [-o <image>] [options]
    CommonOptions opts;
    if (int rc = parse_common_options(argc, argv, "run", opts); rc != 0)
        return rc < 0 ? 0 : rc;

    std::string text;
    if (int rc = load_request_text(opts, text); rc != 0)
        return rc;

    auto req = parse_request_json(text);
    if (!req.isOk())
    {
        report_error("run", req.error());
        return 3;
    }

    ShaderTestRequest request = std::move(req.value());
    if (!opts.outPath.empty())
        request.outputPath = opts.outPath;

    PosixProcessRunner runner;

    auto r = run_shader_test(request, opts.config, runner);
    if (!r.isOk())
    {
        report_error("run", r.error());
        return exit_code_for(r.error());
    }

    const ShaderTestReport& report = r.value();
    log_verbose_lines(report.log);

    std::cout << format_report(report);
    std::cout.flush();

    return report.outcome.passed ? 0 : 1;
}

static int cmd_compile(int argc, char** argv)
{
    // vshaderrun compile -r <request.json> [options]
    CommonOptions opts;
    if (int rc = parse_common_options(argc, argv, "compile", opts); rc != 0)
        return rc < 0 ? 0 : rc;

    std::string text;
    if (int rc = load_request_text(opts, text); rc != 0)
        return rc;

    auto reqs = parse_compile_request_json(text);
    if (!reqs.isOk())
    {
        report_error("compile", reqs.error());
        return 3;
    }

    PosixProcessRunner runner;

    auto r = compile_shaders(reqs.value(), opts.config, runner);
    if (!r.isOk())
    {
        report_error("compile", r.error());
        return exit_code_for(r.error());
    }

    for (const auto& s : r.value())
    {
        log_info(std::string("Compiled ") + stage_name(s.stage) + " -> " + s.outputPath);
        if (!s.stderrText.empty())
            log_verbose_lines(s.stderrText);
    }

    return 0;
}

static int cmd_emit(int argc, char** argv)
{
    // vshaderrun emit -r <request.json> [-o <script>] [options]
    CommonOptions opts;
    if (int rc = parse_common_options(argc, argv, "emit", opts); rc != 0)
        return rc < 0 ? 0 : rc;

    std::string text;
    if (int rc = load_request_text(opts, text); rc != 0)
        return rc;

    auto req = parse_request_json(text);
    if (!req.isOk())
    {
        report_error("emit", req.error());
        return 3;
    }

    PosixProcessRunner runner;

    auto r = emit_script(req.value(), opts.config, runner);
    if (!r.isOk())
    {
        report_error("emit", r.error());
        return exit_code_for(r.error());
    }

    log_verbose_lines(r.value().log);

    if (opts.outPath.empty())
    {
        std::cout << r.value().scriptText;
        std::cout.flush();
        return 0;
    }

    std::ofstream f(opts.outPath, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        log_error("emit: failed to open output: " + opts.outPath);
        return 5;
    }
    f << r.value().scriptText;
    f.flush();
    if (!f)
    {
        log_error("emit: failed to write output: " + opts.outPath);
        return 5;
    }

    log_info("Wrote " + opts.outPath);
    return 0;
}

static int cmd_preprocess(int argc, char** argv)
{
    // vshaderrun preprocess -i <script> [-D TOKEN=REPLACEMENT]...
    std::string                   inPath;
    std::vector<TokenReplacement> replacements;

    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage();
            return 0;
        }
        else if (a == "-i" && i + 1 < argc)
        {
            inPath = argv[++i];
        }
        else if (a == "-D" && i + 1 < argc)
        {
            TokenReplacement tr;
            if (!parse_token_replacement(argv[++i], tr))
            {
                log_error(std::string("preprocess: -D expects TOKEN=REPLACEMENT, got: ") + argv[i]);
                return 2;
            }
            replacements.push_back(std::move(tr));
        }
        else if (a == "--verbose")
        {
            g_verbose = true;
        }
        else
        {
            log_error("Unknown preprocess argument: " + a);
            print_usage();
            return 2;
        }
    }

    if (inPath.empty())
    {
        log_error("preprocess: input must be specified (-i)");
        return 2;
    }

    Source source = Source::from_file(inPath);
    for (auto& tr : replacements)
    {
        auto r = source.add_token_replacement(std::move(tr.token), std::move(tr.replacement));
        if (!r.isOk())
        {
            report_error("preprocess", r.error());
            return 2;
        }
    }

    LineReader reader(std::move(source));
    for (;;)
    {
        auto line = reader.read_line();
        if (!line.isOk())
        {
            report_error("preprocess", line.error());
            return line.error().code == ErrorCode::eIO ? 3 : 5;
        }
        if (!line.value())
            break;
        std::cout << *line.value() << '\n';
    }

    std::cout.flush();
    log_verbose("Read " + std::to_string(reader.line_number()) + " lines from " + inPath);
    return 0;
}

int main(int argc, char** argv)
{
    if (argc <= 1)
    {
        print_usage();
        return 2;
    }

    const std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help")
    {
        print_usage();
        return 0;
    }

    if (cmd == "run")
        return cmd_run(argc, argv);

    if (cmd == "compile")
        return cmd_compile(argc, argv);

    if (cmd == "emit")
        return cmd_emit(argc, argv);

    if (cmd == "preprocess")
        return cmd_preprocess(argc, argv);

    log_error("Unknown command: " + cmd);
    print_usage();
    return 2;
}
