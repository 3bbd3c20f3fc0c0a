#include <vshadertest/process.hpp>
#include <vshadertest/system.hpp>

#include <fstream>
#include <iostream>

using namespace vshadertest;

static std::string readFile(const char* path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        return {};

    f.seekg(0, std::ios::end);
    size_t s = f.tellg();
    f.seekg(0, std::ios::beg);
    std::string out(s, '\0');
    f.read(out.data(), s);

    f.close();

    return out;
}

int main()
{
    auto sourceText = readFile("shaders/gradient.frag");
    if (sourceText.empty())
    {
        std::cout << "Failed to read shader source.\n";
        return 1;
    }

    ShaderTestRequest req;
    req.compileRequests.push_back({ShaderStage::eFrag, sourceText, "gradient/frag.spvasm"});

    req.spec.requirements.push_back(require::Framebuffer {"R8G8B8A8_UNORM"});
    req.spec.passes.push_back(VertPassthrough {});
    req.spec.passes.push_back(SpirvPass {ShaderStage::eFrag, "gradient/frag.spvasm"});

    req.spec.tests.push_back(cmd::Clear {});
    req.spec.tests.push_back(cmd::DrawRect {-1.0f, -1.0f, 2.0f, 2.0f});
    req.spec.tests.push_back(cmd::Tolerance {{0.02f, 0.02f, 0.02f, 0.02f}});
    // Top-left pixel of the default 250x250 framebuffer.
    req.spec.tests.push_back(cmd::Probe {"rect", "rgba", {"(0, 0, 1, 1)", "(0.0, 0.0, 0.5, 1.0)"}});

    req.outputPath = "gradient.png";

    ToolchainConfig cfg;
    cfg.scratch.root = "/tmp/vshadertest-example";

    PosixProcessRunner runner;

    auto r = run_shader_test(req, cfg, runner);
    if (!r.isOk())
    {
        std::cout << "FAIL: " << r.error().message << "\n";
        return 1;
    }

    const auto& report = r.value();

    std::cout << (report.outcome.passed ? "PASS" : "FAIL") << " (exit code " << report.outcome.exitCode << ")\n";
    std::cout << "Compiled stages: " << report.compiledStages.size() << "\n";
    for (const auto& s : report.compiledStages)
        std::cout << "  " << stage_name(s.stage) << ": " << s.outputPath << "\n";

    std::cout << "Script: " << report.scriptPath << "\n";
    std::cout << "Log:\n" << report.log;

    switch (report.imageStatus)
    {
        case ImageStatus::eNotRequested:
            std::cout << "Image: not requested\n";
            break;
        case ImageStatus::eSaved:
        case ImageStatus::eNotGenerated:
        case ImageStatus::eConversionFailed:
            std::cout << "Image: " << report.imageMessage << "\n";
            break;
    }

    if (!report.outcome.passed)
    {
        std::cout << "\n" << format_report(report);
        return 1;
    }

    return 0;
}
