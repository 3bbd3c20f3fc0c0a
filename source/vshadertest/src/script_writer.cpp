#include "vshadertest/script_writer.hpp"
#include "vshadertest/scratch.hpp"

#include <charconv>
#include <fstream>

namespace vshadertest
{
    // ------------------------------------------------------------
    // Small utilities
    // ------------------------------------------------------------
    namespace
    {
        bool read_text_file(const std::string& path, std::string& out)
        {
            std::ifstream f(path, std::ios::binary);
            if (!f)
                return false;

            f.seekg(0, std::ios::end);
            const std::streamoff size = f.tellg();
            if (size < 0)
                return false;

            f.seekg(0, std::ios::beg);

            out.resize(static_cast<size_t>(size));
            f.read(out.data(), size);

            return static_cast<bool>(f);
        }

        std::string set_prefix(const std::optional<uint32_t>& descriptorSet)
        {
            if (!descriptorSet)
                return {};
            return std::to_string(*descriptorSet) + ":";
        }

        // " v0 v1 v2"
        void append_values(std::string& line, const std::vector<std::string>& values)
        {
            for (const auto& v : values)
            {
                line.push_back(' ');
                line += v;
            }
        }

        std::string byte_subdata(const char* keyword, const std::string& binding, const std::vector<uint8_t>& data)
        {
            std::string line = std::string(keyword) + " " + binding + " subdata uint8_t 0";
            for (uint8_t b : data)
            {
                line.push_back(' ');
                line += std::to_string(b);
            }
            return line;
        }

        const char* bool_str(bool b) { return b ? "true" : "false"; }

        // --------------------------------------------------------
        // Visitors: one fixed template per variant case
        // --------------------------------------------------------
        struct RequirementFormatter
        {
            std::string operator()(const require::CooperativeMatrix& r) const
            {
                return "cooperative_matrix m=" + std::to_string(r.m) + " n=" + std::to_string(r.n) +
                       " c=" + r.componentType;
            }
            std::string operator()(const require::DepthStencil& r) const { return "depthstencil " + r.format; }
            std::string operator()(const require::Framebuffer& r) const { return "framebuffer " + r.format; }
            std::string operator()(const require::ShaderFloat64&) const { return "shaderFloat64"; }
            std::string operator()(const require::GeometryShader&) const { return "geometryShader"; }
            std::string operator()(const require::WideLines&) const { return "wideLines"; }
            std::string operator()(const require::LogicOp&) const { return "logicOp"; }
            std::string operator()(const require::SubgroupSize& r) const
            {
                return "subgroup_size " + std::to_string(r.size);
            }
            std::string operator()(const require::FragmentStoresAndAtomics&) const
            {
                return "fragmentStoresAndAtomics";
            }
            std::string operator()(const require::BufferDeviceAddress&) const { return "bufferDeviceAddress"; }
        };

        struct PassHeaderFormatter
        {
            std::string operator()(const VertPassthrough&) const { return "[vertex shader passthrough]"; }
            std::string operator()(const SpirvPass& p) const
            {
                return std::string("[") + stage_display_name(p.stage) + " shader spirv]";
            }
        };

        struct VertexDataFormatter
        {
            std::string operator()(const vertex::AttributeFormat& v) const
            {
                return std::to_string(v.location) + "/" + v.format;
            }
            std::string operator()(const vertex::Vec2& v) const
            {
                return format_float(v.x) + " " + format_float(v.y);
            }
            std::string operator()(const vertex::Vec3& v) const
            {
                return format_float(v.x) + " " + format_float(v.y) + " " + format_float(v.z);
            }
            std::string operator()(const vertex::Vec4& v) const
            {
                return format_float(v.x) + " " + format_float(v.y) + " " + format_float(v.z) + " " +
                       format_float(v.w);
            }
            std::string operator()(const vertex::Rgb& v) const
            {
                return std::to_string(v.r) + " " + std::to_string(v.g) + " " + std::to_string(v.b);
            }
            std::string operator()(const vertex::Hex& v) const { return v.value; }
            std::string operator()(const vertex::GenericComponents& v) const
            {
                std::string line;
                for (const auto& c : v.components)
                {
                    line += c;
                    line.push_back(' ');
                }
                return line;
            }
        };

        struct TestCommandFormatter
        {
            std::string operator()(const cmd::Entrypoint& t) const
            {
                return std::string(stage_display_name(t.stage)) + " entrypoint " + t.name;
            }
            std::string operator()(const cmd::DrawRect& t) const
            {
                return "draw rect " + format_float(t.x) + " " + format_float(t.y) + " " + format_float(t.width) +
                       " " + format_float(t.height);
            }
            std::string operator()(const cmd::DrawArrays& t) const
            {
                return "draw arrays " + t.primitiveType + " " + std::to_string(t.first) + " " +
                       std::to_string(t.count);
            }
            std::string operator()(const cmd::DrawArraysIndexed& t) const
            {
                return "draw arrays indexed " + t.primitiveType + " " + std::to_string(t.first) + " " +
                       std::to_string(t.count);
            }
            std::string operator()(const cmd::Ssbo& t) const
            {
                const std::string binding = set_prefix(t.descriptorSet) + std::to_string(t.binding);
                const bool        hasData = t.data && !t.data->empty();

                if (hasData && !t.size)
                    return byte_subdata("ssbo", binding, *t.data);

                std::string line = "ssbo " + binding + " " + std::to_string(t.size.value_or(0));
                if (hasData)
                {
                    line.push_back('\n');
                    line += byte_subdata("ssbo", binding, *t.data);
                }
                return line;
            }
            std::string operator()(const cmd::SsboSubData& t) const
            {
                std::string line = "ssbo " + set_prefix(t.descriptorSet) + std::to_string(t.binding) + " subdata " +
                                   t.dataType + " " + std::to_string(t.offset);
                append_values(line, t.values);
                return line;
            }
            std::string operator()(const cmd::Ubo& t) const
            {
                return byte_subdata("ubo", set_prefix(t.descriptorSet) + std::to_string(t.binding), t.data);
            }
            std::string operator()(const cmd::UboSubData& t) const
            {
                std::string line = "ubo " + set_prefix(t.descriptorSet) + std::to_string(t.binding) + " subdata " +
                                   t.dataType + " " + std::to_string(t.offset);
                append_values(line, t.values);
                return line;
            }
            std::string operator()(const cmd::BufferLayout& t) const
            {
                return t.bufferType + " layout " + t.layoutType;
            }
            std::string operator()(const cmd::Push& t) const
            {
                std::string line = "push " + t.dataType + " " + std::to_string(t.offset);
                append_values(line, t.values);
                return line;
            }
            std::string operator()(const cmd::PushLayout& t) const { return "push layout " + t.layoutType; }
            std::string operator()(const cmd::Compute& t) const
            {
                return "compute " + std::to_string(t.x) + " " + std::to_string(t.y) + " " + std::to_string(t.z);
            }
            std::string operator()(const cmd::Probe& t) const
            {
                std::string line = "probe " + t.probeType + " " + t.format;
                append_values(line, t.args);
                return line;
            }
            std::string operator()(const cmd::RelativeProbe& t) const
            {
                std::string line = "relative probe " + t.probeType + " " + t.format;
                append_values(line, t.args);
                return line;
            }
            std::string operator()(const cmd::Tolerance& t) const
            {
                std::string line = "tolerance";
                for (float v : t.values)
                {
                    line.push_back(' ');
                    line += format_float(v);
                }
                return line;
            }
            std::string operator()(const cmd::Clear&) const { return "clear"; }
            std::string operator()(const cmd::DepthTestEnable& t) const
            {
                return std::string("depthTestEnable ") + bool_str(t.enable);
            }
            std::string operator()(const cmd::DepthWriteEnable& t) const
            {
                return std::string("depthWriteEnable ") + bool_str(t.enable);
            }
            std::string operator()(const cmd::DepthCompareOp& t) const { return "depthCompareOp " + t.op; }
            std::string operator()(const cmd::StencilTestEnable& t) const
            {
                return std::string("stencilTestEnable ") + bool_str(t.enable);
            }
            std::string operator()(const cmd::FrontFace& t) const { return "frontFace " + t.mode; }
            std::string operator()(const cmd::StencilOp& t) const { return t.face + "." + t.opName + " " + t.value; }
            std::string operator()(const cmd::StencilReference& t) const
            {
                return t.face + ".reference " + std::to_string(t.value);
            }
            std::string operator()(const cmd::StencilCompareOp& t) const { return t.face + ".compareOp " + t.op; }
            std::string operator()(const cmd::ColorWriteMask& t) const { return "colorWriteMask " + t.mask; }
            std::string operator()(const cmd::LogicOpEnable& t) const
            {
                return std::string("logicOpEnable ") + bool_str(t.enable);
            }
            std::string operator()(const cmd::LogicOp& t) const { return "logicOp " + t.op; }
            std::string operator()(const cmd::CullMode& t) const { return "cullMode " + t.mode; }
            std::string operator()(const cmd::LineWidth& t) const { return "lineWidth " + format_float(t.width); }
            std::string operator()(const cmd::Require& t) const
            {
                std::string line = "require " + t.feature;
                append_values(line, t.parameters);
                return line;
            }
        };
    } // namespace

    std::string format_float(float v)
    {
        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        if (ec != std::errc())
            return std::to_string(v);
        return std::string(buf, end);
    }

    std::string format_requirement(const Requirement& r) { return std::visit(RequirementFormatter {}, r); }

    std::string format_pass_header(const Pass& p) { return std::visit(PassHeaderFormatter {}, p); }

    std::string format_vertex_data(const VertexData& v) { return std::visit(VertexDataFormatter {}, v); }

    std::string format_test_command(const TestCommand& t) { return std::visit(TestCommandFormatter {}, t); }

    Result<std::string> serialize_script(const ShaderTestSpec& spec, const ArtifactResolver& resolve)
    {
        std::string out;
        out.reserve(1024);

        if (!spec.requirements.empty())
        {
            out += "[require]\n";
            for (const auto& r : spec.requirements)
            {
                out += format_requirement(r);
                out.push_back('\n');
            }
            out.push_back('\n');
        }

        for (const auto& pass : spec.passes)
        {
            out += format_pass_header(pass);
            out.push_back('\n');

            if (const auto* sp = std::get_if<SpirvPass>(&pass))
            {
                const std::string path = resolve ? resolve(sp->path) : sp->path;

                std::string spvasm;
                if (!read_text_file(path, spvasm))
                    return Result<std::string>::err({ErrorCode::eIO,
                                                     std::string("Failed to open ") + stage_display_name(sp->stage) +
                                                         " shader SPIR-V file at " + path});

                out += spvasm;
                out.push_back('\n');
            }

            out.push_back('\n');
        }

        if (spec.vertexData)
        {
            out += "[vertex data]\n";
            for (const auto& v : *spec.vertexData)
            {
                out += format_vertex_data(v);
                out.push_back('\n');
            }
            out.push_back('\n');
        }

        out += "[test]\n";
        for (const auto& t : spec.tests)
        {
            out += format_test_command(t);
            out.push_back('\n');
        }

        return Result<std::string>::ok(std::move(out));
    }

    Result<void> write_script_file(const std::string& path, const std::string& text)
    {
        auto dir = ensure_parent_directory(path);
        if (!dir.isOk())
            return dir;

        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f)
            return Result<void>::err({ErrorCode::eIO, "Failed to create shader test file " + path});

        f.write(text.data(), static_cast<std::streamsize>(text.size()));
        f.flush();
        if (!f)
            return Result<void>::err({ErrorCode::eIO, "Failed to write shader test file " + path});

        return Result<void>::ok();
    }
} // namespace vshadertest
