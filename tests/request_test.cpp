#include "test_utils.h"

#include <vshadertest/request.hpp>

using namespace vshadertest;

namespace
{
    ShaderTestRequest parse_ok(const std::string& json)
    {
        auto r = parse_request_json(json);
        EXPECT_TRUE(r.isOk()) << r.error().message;
        return r.isOk() ? r.value() : ShaderTestRequest {};
    }

    std::string parse_error(const std::string& json)
    {
        auto r = parse_request_json(json);
        EXPECT_FALSE(r.isOk());
        if (r.isOk())
            return {};
        EXPECT_EQ(r.error().code, ErrorCode::eParseError);
        return r.error().message;
    }

    // Wraps one test command in an otherwise minimal request.
    std::string with_test(const std::string& command)
    {
        return R"({"requests": [], "passes": [], "tests": [)" + command + "]}";
    }
} // namespace

TEST(RequestTest, ParsesFullRequest)
{
    const auto req = parse_ok(R"({
        "requests": [
            {"stage": "Frag", "source": "#version 450\nvoid main() {}", "tmp_output_path": "frag.spvasm"}
        ],
        "requirements": [
            {"Framebuffer": "R8G8B8A8_UNORM"},
            {"CooperativeMatrix": {"m": 16, "n": 16, "component_type": "float16_t"}},
            "ShaderFloat64",
            {"SubgroupSize": 32}
        ],
        "passes": ["VertPassthrough", {"FragSpirv": {"frag_spvasm_path": "frag.spvasm"}}],
        "vertex_data": [
            {"AttributeFormat": {"location": 0, "format": "R32G32_SFLOAT"}},
            {"Vec2": {"x": -1, "y": 0.5}}
        ],
        "tests": [
            "Clear",
            {"DrawRect": {"x": -1, "y": -1, "width": 2, "height": 2}},
            {"Probe": {"probe_type": "all", "format": "rgba", "args": ["1", "0", "0", "1"]}}
        ],
        "output_path": "renders/out.png"
    })");

    ASSERT_EQ(req.compileRequests.size(), 1u);
    EXPECT_EQ(req.compileRequests[0].stage, ShaderStage::eFrag);
    EXPECT_EQ(req.compileRequests[0].source, "#version 450\nvoid main() {}");
    EXPECT_EQ(req.compileRequests[0].outputPath, "frag.spvasm");

    ASSERT_EQ(req.spec.requirements.size(), 4u);
    EXPECT_EQ(std::get<require::Framebuffer>(req.spec.requirements[0]).format, "R8G8B8A8_UNORM");
    const auto& coop = std::get<require::CooperativeMatrix>(req.spec.requirements[1]);
    EXPECT_EQ(coop.m, 16u);
    EXPECT_EQ(coop.componentType, "float16_t");
    EXPECT_TRUE(std::holds_alternative<require::ShaderFloat64>(req.spec.requirements[2]));
    EXPECT_EQ(std::get<require::SubgroupSize>(req.spec.requirements[3]).size, 32u);

    ASSERT_EQ(req.spec.passes.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<VertPassthrough>(req.spec.passes[0]));
    const auto& frag = std::get<SpirvPass>(req.spec.passes[1]);
    EXPECT_EQ(frag.stage, ShaderStage::eFrag);
    EXPECT_EQ(frag.path, "frag.spvasm");

    ASSERT_TRUE(req.spec.vertexData.has_value());
    ASSERT_EQ(req.spec.vertexData->size(), 2u);
    EXPECT_FLOAT_EQ(std::get<vertex::Vec2>((*req.spec.vertexData)[1]).y, 0.5f);

    ASSERT_EQ(req.spec.tests.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<cmd::Clear>(req.spec.tests[0]));
    EXPECT_FLOAT_EQ(std::get<cmd::DrawRect>(req.spec.tests[1]).width, 2.0f);
    EXPECT_EQ(std::get<cmd::Probe>(req.spec.tests[2]).args.size(), 4u);

    ASSERT_TRUE(req.outputPath.has_value());
    EXPECT_EQ(*req.outputPath, "renders/out.png");
}

TEST(RequestTest, OptionalFieldsMayBeAbsentOrNull)
{
    auto req = parse_ok(R"({"requests": [], "passes": [], "tests": []})");
    EXPECT_TRUE(req.spec.requirements.empty());
    EXPECT_FALSE(req.spec.vertexData.has_value());
    EXPECT_FALSE(req.outputPath.has_value());

    req = parse_ok(R"({"requests": [], "requirements": null, "passes": [], "vertex_data": null,
                      "tests": [], "output_path": null})");
    EXPECT_TRUE(req.spec.requirements.empty());
    EXPECT_FALSE(req.spec.vertexData.has_value());
    EXPECT_FALSE(req.outputPath.has_value());
}

TEST(RequestTest, EmptyVertexDataIsKept)
{
    const auto req = parse_ok(R"({"requests": [], "passes": [], "vertex_data": [], "tests": []})");
    ASSERT_TRUE(req.spec.vertexData.has_value());
    EXPECT_TRUE(req.spec.vertexData->empty());
}

TEST(RequestTest, UnitVariantAcceptsNullBody)
{
    const auto req = parse_ok(with_test(R"({"Clear": null})"));
    ASSERT_EQ(req.spec.tests.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<cmd::Clear>(req.spec.tests[0]));
}

TEST(RequestTest, EveryPassStage)
{
    const auto req = parse_ok(R"({"requests": [], "tests": [], "passes": [
        {"VertSpirv": {"vert_spvasm_path": "v"}},
        {"TescSpirv": {"tesc_spvasm_path": "tc"}},
        {"TeseSpirv": {"tese_spvasm_path": "te"}},
        {"GeomSpirv": {"geom_spvasm_path": "g"}},
        {"CompSpirv": {"comp_spvasm_path": "c"}}
    ]})");

    ASSERT_EQ(req.spec.passes.size(), 5u);
    EXPECT_EQ(std::get<SpirvPass>(req.spec.passes[0]).stage, ShaderStage::eVert);
    EXPECT_EQ(std::get<SpirvPass>(req.spec.passes[1]).stage, ShaderStage::eTesc);
    EXPECT_EQ(std::get<SpirvPass>(req.spec.passes[2]).stage, ShaderStage::eTese);
    EXPECT_EQ(std::get<SpirvPass>(req.spec.passes[3]).stage, ShaderStage::eGeom);
    EXPECT_EQ(std::get<SpirvPass>(req.spec.passes[4]).path, "c");
}

TEST(RequestTest, BufferCommands)
{
    const auto req = parse_ok(with_test(R"(
        {"SSBO": {"binding": 1, "size": 64, "descriptor_set": 2}},
        {"SSBO": {"binding": 0, "data": [1, 2, 255]}},
        {"UBO": {"binding": 3, "data": [0, 0, 128, 63]}},
        {"SSBOSubData": {"binding": 1, "data_type": "float", "offset": 4, "values": ["1.5"], "descriptor_set": null}},
        {"UBOSubData": {"binding": 0, "data_type": "vec4", "offset": 0, "values": ["1", "0", "0", "1"], "descriptor_set": 1}}
    )"));

    ASSERT_EQ(req.spec.tests.size(), 5u);

    const auto& sized = std::get<cmd::Ssbo>(req.spec.tests[0]);
    EXPECT_EQ(sized.size, std::optional<uint32_t>(64));
    EXPECT_EQ(sized.descriptorSet, std::optional<uint32_t>(2));
    EXPECT_FALSE(sized.data.has_value());

    const auto& filled = std::get<cmd::Ssbo>(req.spec.tests[1]);
    EXPECT_FALSE(filled.size.has_value());
    ASSERT_TRUE(filled.data.has_value());
    EXPECT_EQ(*filled.data, (std::vector<uint8_t> {1, 2, 255}));

    EXPECT_EQ(std::get<cmd::Ubo>(req.spec.tests[2]).data, (std::vector<uint8_t> {0, 0, 128, 63}));
    EXPECT_FALSE(std::get<cmd::SsboSubData>(req.spec.tests[3]).descriptorSet.has_value());
    EXPECT_EQ(std::get<cmd::UboSubData>(req.spec.tests[4]).descriptorSet, std::optional<uint32_t>(1));
}

TEST(RequestTest, StateCommands)
{
    const auto req = parse_ok(with_test(R"(
        {"FragmentEntrypoint": {"name": "main"}},
        {"DepthTestEnable": {"enable": true}},
        {"StencilOp": {"face": "front", "op_name": "passOp", "value": "VK_STENCIL_OP_REPLACE"}},
        {"StencilReference": {"face": "back", "value": 7}},
        {"CullMode": {"mode": "VK_CULL_MODE_NONE"}},
        {"LineWidth": {"width": 2.5}},
        {"Tolerance": {"values": [0.01, 0.02]}},
        {"Require": {"feature": "subgroup_size", "parameters": ["16"]}}
    )"));

    ASSERT_EQ(req.spec.tests.size(), 8u);
    EXPECT_EQ(std::get<cmd::Entrypoint>(req.spec.tests[0]).name, "main");
    EXPECT_TRUE(std::get<cmd::DepthTestEnable>(req.spec.tests[1]).enable);
    EXPECT_EQ(std::get<cmd::StencilOp>(req.spec.tests[2]).opName, "passOp");
    EXPECT_EQ(std::get<cmd::StencilReference>(req.spec.tests[3]).value, 7u);
    EXPECT_EQ(std::get<cmd::CullMode>(req.spec.tests[4]).mode, "VK_CULL_MODE_NONE");
    EXPECT_FLOAT_EQ(std::get<cmd::LineWidth>(req.spec.tests[5]).width, 2.5f);
    EXPECT_EQ(std::get<cmd::Tolerance>(req.spec.tests[6]).values.size(), 2u);
    EXPECT_EQ(std::get<cmd::Require>(req.spec.tests[7]).parameters, (std::vector<std::string> {"16"}));
}

// ------------------------------------------------------------
// Errors
// ------------------------------------------------------------

TEST(RequestTest, MalformedJson)
{
    auto r = parse_request_json("{\"requests\": [");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eParseError);
    EXPECT_EQ(r.error().message.rfind("Invalid JSON: ", 0), 0u);
}

TEST(RequestTest, RootMustBeObject)
{
    EXPECT_EQ(parse_error("[1, 2]"), "request: expected an object");
}

TEST(RequestTest, MissingRequiredField)
{
    EXPECT_EQ(parse_error(R"({"requests": [], "tests": []})"), "passes: missing field");
    EXPECT_EQ(parse_error(R"({"passes": [], "tests": []})"), "requests: missing field");
}

TEST(RequestTest, ErrorNamesOffendingPath)
{
    EXPECT_EQ(parse_error(with_test(R"("Clear", {"DrawRect": {"x": "left", "y": 0, "width": 1, "height": 1}})")),
              "tests[1].DrawRect.x: expected a number");

    EXPECT_EQ(parse_error(R"({"requests": [{"stage": "Frag", "source": "", "tmp_output_path": 4}],
                              "passes": [], "tests": []})"),
              "requests[0].tmp_output_path: expected a string");
}

TEST(RequestTest, UnknownVariantsAreRejected)
{
    EXPECT_EQ(parse_error(with_test(R"("Explode")")), "tests[0]: unknown test command 'Explode'");
    EXPECT_EQ(parse_error(R"({"requests": [], "passes": ["FragPassthrough"], "tests": []})"),
              "passes[0]: unknown pass 'FragPassthrough'");
    EXPECT_EQ(parse_error(R"({"requests": [{"stage": "Mesh", "source": "", "tmp_output_path": "m"}],
                              "passes": [], "tests": []})"),
              "requests[0].stage: unknown shader stage 'Mesh'");
}

TEST(RequestTest, VariantShapeIsChecked)
{
    EXPECT_EQ(parse_error(with_test(R"({"Clear": {}, "DrawRect": {}})")),
              "tests[0]: expected a variant name or an object with exactly one key");
    EXPECT_EQ(parse_error(with_test(R"({"Clear": 1})")), "tests[0].Clear: variant takes no data");
}

TEST(RequestTest, ByteValuesAreRangeChecked)
{
    EXPECT_EQ(parse_error(with_test(R"({"UBO": {"binding": 0, "data": [1, 256]}})")),
              "tests[0].UBO.data[1]: expected an integer in 0..255");
}

TEST(RequestTest, NegativeBindingIsRejected)
{
    EXPECT_EQ(parse_error(with_test(R"({"SSBO": {"binding": -1, "size": 4}})")),
              "tests[0].SSBO.binding: expected an unsigned 32-bit integer");
}

// ------------------------------------------------------------
// Compile-only form and files
// ------------------------------------------------------------

TEST(RequestTest, CompileRequestsOnly)
{
    auto r = parse_compile_request_json(R"({"requests": [
        {"stage": "Vert", "source": "a", "tmp_output_path": "v.spvasm"},
        {"stage": "Comp", "source": "b", "tmp_output_path": "c.spvasm"}
    ]})");
    ASSERT_TRUE(r.isOk()) << r.error().message;
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0].stage, ShaderStage::eVert);
    EXPECT_EQ(r.value()[1].outputPath, "c.spvasm");
}

TEST(RequestTest, ReadRequestText)
{
    vshadertest_test::TempDir tmp;
    ASSERT_TRUE(vshadertest_test::WriteFile(tmp.file("req.json"), "{}"));

    auto r = read_request_text(tmp.file("req.json"));
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(r.value(), "{}");

    auto missing = read_request_text(tmp.file("absent.json"));
    ASSERT_FALSE(missing.isOk());
    EXPECT_EQ(missing.error().code, ErrorCode::eIO);
}
