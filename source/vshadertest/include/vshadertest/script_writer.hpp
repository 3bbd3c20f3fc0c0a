#pragma once

#include "vshadertest/pipeline.hpp"
#include "vshadertest/result.hpp"

#include <functional>
#include <string>

namespace vshadertest
{
    // Maps the path named in a pass to the file to read.
    using ArtifactResolver = std::function<std::string(const std::string& passPath)>;

    // Shortest decimal form that reads back as the same float ("1", "0.5").
    std::string format_float(float v);

    // Single script lines; exposed for tests and tools.
    std::string format_requirement(const Requirement& r);
    std::string format_pass_header(const Pass& p);
    std::string format_vertex_data(const VertexData& v);

    // One line per command, except an Ssbo carrying both a size and
    // initial data which yields the size line followed by the data line.
    std::string format_test_command(const TestCommand& t);

    // Renders the whole shader_test script:
    //   [require]        only when requirements are present
    //   pass sections    in input order; spirv passes embed the file text
    //   [vertex data]    only when vertex data is present
    //   [test]           always
    // Fails only when a pass file cannot be read.
    Result<std::string> serialize_script(const ShaderTestSpec& spec, const ArtifactResolver& resolve);

    Result<void> write_script_file(const std::string& path, const std::string& text);
} // namespace vshadertest
