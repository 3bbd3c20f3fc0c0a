#include "vshadertest/request.hpp"

#include <json/json.h>

#include <fstream>
#include <iterator>
#include <memory>

namespace vshadertest
{
    namespace
    {
        // ------------------------------------------------------------
        // Decoder
        //
        // Every read_* helper returns false after recording the first
        // failure together with the JSON path it occurred at.
        // ------------------------------------------------------------
        class RequestDecoder
        {
        public:
            const Error& error() const { return m_Error; }

            bool fail(const std::string& path, const std::string& what)
            {
                m_Error = {ErrorCode::eParseError, (path.empty() ? std::string("request") : path) + ": " + what};
                return false;
            }

            static std::string join(const std::string& path, const char* key)
            {
                return path.empty() ? std::string(key) : path + "." + key;
            }

            static std::string index(const std::string& path, Json::ArrayIndex i)
            {
                return path + "[" + std::to_string(i) + "]";
            }

            bool require_object(const Json::Value& v, const std::string& path)
            {
                if (!v.isObject())
                    return fail(path, "expected an object");
                return true;
            }

            bool require_array(const Json::Value& v, const std::string& path)
            {
                if (!v.isArray())
                    return fail(path, "expected an array");
                return true;
            }

            bool member(const Json::Value& obj, const char* key, const std::string& path, const Json::Value*& out)
            {
                if (!obj.isMember(key))
                    return fail(join(path, key), "missing field");
                out = &obj[key];
                return true;
            }

            bool read_string(const Json::Value& obj, const char* key, const std::string& path, std::string& out)
            {
                const Json::Value* v = nullptr;
                if (!member(obj, key, path, v))
                    return false;
                return as_string(*v, join(path, key), out);
            }

            bool as_string(const Json::Value& v, const std::string& path, std::string& out)
            {
                if (!v.isString())
                    return fail(path, "expected a string");
                out = v.asString();
                return true;
            }

            bool read_u32(const Json::Value& obj, const char* key, const std::string& path, uint32_t& out)
            {
                const Json::Value* v = nullptr;
                if (!member(obj, key, path, v))
                    return false;
                return as_u32(*v, join(path, key), out);
            }

            bool as_u32(const Json::Value& v, const std::string& path, uint32_t& out)
            {
                if (!v.isUInt())
                    return fail(path, "expected an unsigned 32-bit integer");
                out = v.asUInt();
                return true;
            }

            bool as_u8(const Json::Value& v, const std::string& path, uint8_t& out)
            {
                if (!v.isUInt() || v.asUInt() > 255)
                    return fail(path, "expected an integer in 0..255");
                out = static_cast<uint8_t>(v.asUInt());
                return true;
            }

            bool read_u8(const Json::Value& obj, const char* key, const std::string& path, uint8_t& out)
            {
                const Json::Value* v = nullptr;
                if (!member(obj, key, path, v))
                    return false;
                return as_u8(*v, join(path, key), out);
            }

            // Absent and null both mean "not set".
            bool read_optional_u32(const Json::Value&       obj,
                                   const char*              key,
                                   const std::string&       path,
                                   std::optional<uint32_t>& out)
            {
                out.reset();
                if (!obj.isMember(key) || obj[key].isNull())
                    return true;

                uint32_t v = 0;
                if (!as_u32(obj[key], join(path, key), v))
                    return false;
                out = v;
                return true;
            }

            bool read_float(const Json::Value& obj, const char* key, const std::string& path, float& out)
            {
                const Json::Value* v = nullptr;
                if (!member(obj, key, path, v))
                    return false;
                if (!v->isNumeric() || v->isBool())
                    return fail(join(path, key), "expected a number");
                out = v->asFloat();
                return true;
            }

            bool read_bool(const Json::Value& obj, const char* key, const std::string& path, bool& out)
            {
                const Json::Value* v = nullptr;
                if (!member(obj, key, path, v))
                    return false;
                if (!v->isBool())
                    return fail(join(path, key), "expected a boolean");
                out = v->asBool();
                return true;
            }

            bool read_strings(const Json::Value&        obj,
                              const char*               key,
                              const std::string&        path,
                              std::vector<std::string>& out)
            {
                const Json::Value* v = nullptr;
                if (!member(obj, key, path, v))
                    return false;

                const std::string p = join(path, key);
                if (!require_array(*v, p))
                    return false;

                out.clear();
                out.reserve(v->size());
                for (Json::ArrayIndex i = 0; i < v->size(); ++i)
                {
                    std::string s;
                    if (!as_string((*v)[i], index(p, i), s))
                        return false;
                    out.push_back(std::move(s));
                }
                return true;
            }

            bool as_bytes(const Json::Value& v, const std::string& path, std::vector<uint8_t>& out)
            {
                if (!require_array(v, path))
                    return false;

                out.clear();
                out.reserve(v.size());
                for (Json::ArrayIndex i = 0; i < v.size(); ++i)
                {
                    uint8_t b = 0;
                    if (!as_u8(v[i], index(path, i), b))
                        return false;
                    out.push_back(b);
                }
                return true;
            }

            bool read_floats(const Json::Value& obj, const char* key, const std::string& path, std::vector<float>& out)
            {
                const Json::Value* v = nullptr;
                if (!member(obj, key, path, v))
                    return false;

                const std::string p = join(path, key);
                if (!require_array(*v, p))
                    return false;

                out.clear();
                for (Json::ArrayIndex i = 0; i < v->size(); ++i)
                {
                    const Json::Value& e = (*v)[i];
                    if (!e.isNumeric() || e.isBool())
                        return fail(index(p, i), "expected a number");
                    out.push_back(e.asFloat());
                }
                return true;
            }

            // Splits an externally tagged enum value into its tag and body.
            // "Clear" -> ("Clear", null); {"DrawRect": {...}} -> ("DrawRect", {...}).
            bool split_variant(const Json::Value&  v,
                               const std::string&  path,
                               std::string&        tag,
                               const Json::Value*& body)
            {
                static const Json::Value kNull;

                if (v.isString())
                {
                    tag  = v.asString();
                    body = &kNull;
                    return true;
                }

                if (!v.isObject() || v.size() != 1)
                    return fail(path, "expected a variant name or an object with exactly one key");

                tag  = v.getMemberNames().front();
                body = &v[tag];
                return true;
            }

            // Unit variants may be written as a bare string or as {"Name": null}.
            bool unit(const Json::Value& body, const std::string& path)
            {
                if (!body.isNull())
                    return fail(path, "variant takes no data");
                return true;
            }

            // --------------------------------------------------------
            // Enumerations
            // --------------------------------------------------------
            bool read_stage(const Json::Value& obj, const char* key, const std::string& path, ShaderStage& out)
            {
                std::string s;
                if (!read_string(obj, key, path, s))
                    return false;

                if (s == "Vert")
                    out = ShaderStage::eVert;
                else if (s == "Frag")
                    out = ShaderStage::eFrag;
                else if (s == "Tesc")
                    out = ShaderStage::eTesc;
                else if (s == "Tese")
                    out = ShaderStage::eTese;
                else if (s == "Geom")
                    out = ShaderStage::eGeom;
                else if (s == "Comp")
                    out = ShaderStage::eComp;
                else
                    return fail(join(path, key), "unknown shader stage '" + s + "'");
                return true;
            }

            // --------------------------------------------------------
            // Compile requests
            // --------------------------------------------------------
            bool read_compile_request(const Json::Value& v, const std::string& path, CompileRequest& out)
            {
                if (!require_object(v, path))
                    return false;
                return read_stage(v, "stage", path, out.stage) && read_string(v, "source", path, out.source) &&
                       read_string(v, "tmp_output_path", path, out.outputPath);
            }

            bool read_compile_requests(const Json::Value& root, std::vector<CompileRequest>& out)
            {
                const Json::Value* v = nullptr;
                if (!member(root, "requests", "", v) || !require_array(*v, "requests"))
                    return false;

                out.clear();
                for (Json::ArrayIndex i = 0; i < v->size(); ++i)
                {
                    CompileRequest req;
                    if (!read_compile_request((*v)[i], index("requests", i), req))
                        return false;
                    out.push_back(std::move(req));
                }
                return true;
            }

            // --------------------------------------------------------
            // Requirements
            // --------------------------------------------------------
            bool read_requirement(const Json::Value& v, const std::string& path, Requirement& out)
            {
                std::string        tag;
                const Json::Value* body = nullptr;
                if (!split_variant(v, path, tag, body))
                    return false;

                const std::string p = join(path, tag.c_str());

                if (tag == "CooperativeMatrix")
                {
                    require::CooperativeMatrix r;
                    if (!require_object(*body, p) || !read_u32(*body, "m", p, r.m) || !read_u32(*body, "n", p, r.n) ||
                        !read_string(*body, "component_type", p, r.componentType))
                        return false;
                    out = r;
                }
                else if (tag == "DepthStencil")
                {
                    require::DepthStencil r;
                    if (!as_string(*body, p, r.format))
                        return false;
                    out = r;
                }
                else if (tag == "Framebuffer")
                {
                    require::Framebuffer r;
                    if (!as_string(*body, p, r.format))
                        return false;
                    out = r;
                }
                else if (tag == "SubgroupSize")
                {
                    require::SubgroupSize r;
                    if (!as_u32(*body, p, r.size))
                        return false;
                    out = r;
                }
                else if (tag == "ShaderFloat64")
                {
                    out = require::ShaderFloat64 {};
                    return unit(*body, p);
                }
                else if (tag == "GeometryShader")
                {
                    out = require::GeometryShader {};
                    return unit(*body, p);
                }
                else if (tag == "WideLines")
                {
                    out = require::WideLines {};
                    return unit(*body, p);
                }
                else if (tag == "LogicOp")
                {
                    out = require::LogicOp {};
                    return unit(*body, p);
                }
                else if (tag == "FragmentStoresAndAtomics")
                {
                    out = require::FragmentStoresAndAtomics {};
                    return unit(*body, p);
                }
                else if (tag == "BufferDeviceAddress")
                {
                    out = require::BufferDeviceAddress {};
                    return unit(*body, p);
                }
                else
                {
                    return fail(path, "unknown requirement '" + tag + "'");
                }
                return true;
            }

            // --------------------------------------------------------
            // Passes
            // --------------------------------------------------------
            bool read_pass(const Json::Value& v, const std::string& path, Pass& out)
            {
                std::string        tag;
                const Json::Value* body = nullptr;
                if (!split_variant(v, path, tag, body))
                    return false;

                const std::string p = join(path, tag.c_str());

                if (tag == "VertPassthrough")
                {
                    out = VertPassthrough {};
                    return unit(*body, p);
                }

                struct SpirvTag
                {
                    const char* tag;
                    const char* field;
                    ShaderStage stage;
                };
                static const SpirvTag kSpirvTags[] = {
                    {"VertSpirv", "vert_spvasm_path", ShaderStage::eVert},
                    {"FragSpirv", "frag_spvasm_path", ShaderStage::eFrag},
                    {"CompSpirv", "comp_spvasm_path", ShaderStage::eComp},
                    {"GeomSpirv", "geom_spvasm_path", ShaderStage::eGeom},
                    {"TescSpirv", "tesc_spvasm_path", ShaderStage::eTesc},
                    {"TeseSpirv", "tese_spvasm_path", ShaderStage::eTese},
                };

                for (const auto& t : kSpirvTags)
                {
                    if (tag != t.tag)
                        continue;

                    SpirvPass pass;
                    pass.stage = t.stage;
                    if (!require_object(*body, p) || !read_string(*body, t.field, p, pass.path))
                        return false;
                    out = std::move(pass);
                    return true;
                }

                return fail(path, "unknown pass '" + tag + "'");
            }

            // --------------------------------------------------------
            // Vertex data
            // --------------------------------------------------------
            bool read_vertex_data(const Json::Value& v, const std::string& path, VertexData& out)
            {
                std::string        tag;
                const Json::Value* body = nullptr;
                if (!split_variant(v, path, tag, body))
                    return false;

                const std::string p = join(path, tag.c_str());
                if (!require_object(*body, p))
                    return false;

                if (tag == "AttributeFormat")
                {
                    vertex::AttributeFormat d;
                    if (!read_u32(*body, "location", p, d.location) || !read_string(*body, "format", p, d.format))
                        return false;
                    out = std::move(d);
                }
                else if (tag == "Vec2")
                {
                    vertex::Vec2 d;
                    if (!read_float(*body, "x", p, d.x) || !read_float(*body, "y", p, d.y))
                        return false;
                    out = d;
                }
                else if (tag == "Vec3")
                {
                    vertex::Vec3 d;
                    if (!read_float(*body, "x", p, d.x) || !read_float(*body, "y", p, d.y) ||
                        !read_float(*body, "z", p, d.z))
                        return false;
                    out = d;
                }
                else if (tag == "Vec4")
                {
                    vertex::Vec4 d;
                    if (!read_float(*body, "x", p, d.x) || !read_float(*body, "y", p, d.y) ||
                        !read_float(*body, "z", p, d.z) || !read_float(*body, "w", p, d.w))
                        return false;
                    out = d;
                }
                else if (tag == "RGB")
                {
                    vertex::Rgb d;
                    if (!read_u8(*body, "r", p, d.r) || !read_u8(*body, "g", p, d.g) || !read_u8(*body, "b", p, d.b))
                        return false;
                    out = d;
                }
                else if (tag == "Hex")
                {
                    vertex::Hex d;
                    if (!read_string(*body, "value", p, d.value))
                        return false;
                    out = std::move(d);
                }
                else if (tag == "GenericComponents")
                {
                    vertex::GenericComponents d;
                    if (!read_strings(*body, "components", p, d.components))
                        return false;
                    out = std::move(d);
                }
                else
                {
                    return fail(path, "unknown vertex data '" + tag + "'");
                }
                return true;
            }

            // --------------------------------------------------------
            // Test commands
            // --------------------------------------------------------
            bool read_entrypoint(const Json::Value& body, const std::string& p, ShaderStage stage, TestCommand& out)
            {
                cmd::Entrypoint t;
                t.stage = stage;
                if (!require_object(body, p) || !read_string(body, "name", p, t.name))
                    return false;
                out = std::move(t);
                return true;
            }

            template<typename SubData>
            bool read_subdata(const Json::Value& body, const std::string& p, TestCommand& out)
            {
                SubData t;
                if (!require_object(body, p) || !read_u32(body, "binding", p, t.binding) ||
                    !read_string(body, "data_type", p, t.dataType) || !read_u32(body, "offset", p, t.offset) ||
                    !read_strings(body, "values", p, t.values) ||
                    !read_optional_u32(body, "descriptor_set", p, t.descriptorSet))
                    return false;
                out = std::move(t);
                return true;
            }

            template<typename Toggle>
            bool read_toggle(const Json::Value& body, const std::string& p, TestCommand& out)
            {
                Toggle t;
                if (!require_object(body, p) || !read_bool(body, "enable", p, t.enable))
                    return false;
                out = t;
                return true;
            }

            template<typename ProbeT>
            bool read_probe(const Json::Value& body, const std::string& p, TestCommand& out)
            {
                ProbeT t;
                if (!require_object(body, p) || !read_string(body, "probe_type", p, t.probeType) ||
                    !read_string(body, "format", p, t.format) || !read_strings(body, "args", p, t.args))
                    return false;
                out = std::move(t);
                return true;
            }

            template<typename Draw>
            bool read_draw_arrays(const Json::Value& body, const std::string& p, TestCommand& out)
            {
                Draw t;
                if (!require_object(body, p) || !read_string(body, "primitive_type", p, t.primitiveType) ||
                    !read_u32(body, "first", p, t.first) || !read_u32(body, "count", p, t.count))
                    return false;
                out = std::move(t);
                return true;
            }

            bool read_ssbo(const Json::Value& body, const std::string& p, TestCommand& out)
            {
                cmd::Ssbo t;
                if (!require_object(body, p) || !read_u32(body, "binding", p, t.binding) ||
                    !read_optional_u32(body, "size", p, t.size) ||
                    !read_optional_u32(body, "descriptor_set", p, t.descriptorSet))
                    return false;

                if (body.isMember("data") && !body["data"].isNull())
                {
                    std::vector<uint8_t> data;
                    if (!as_bytes(body["data"], join(p, "data"), data))
                        return false;
                    t.data = std::move(data);
                }

                out = std::move(t);
                return true;
            }

            bool read_ubo(const Json::Value& body, const std::string& p, TestCommand& out)
            {
                cmd::Ubo           t;
                const Json::Value* data = nullptr;
                if (!require_object(body, p) || !read_u32(body, "binding", p, t.binding) ||
                    !member(body, "data", p, data) || !as_bytes(*data, join(p, "data"), t.data) ||
                    !read_optional_u32(body, "descriptor_set", p, t.descriptorSet))
                    return false;
                out = std::move(t);
                return true;
            }

            // Commands whose only payload is a single string field.
            template<typename Cmd>
            bool read_single_string(const Json::Value& body,
                                    const std::string& p,
                                    const char*        key,
                                    std::string Cmd::*field,
                                    TestCommand&       out)
            {
                Cmd t;
                if (!require_object(body, p) || !read_string(body, key, p, t.*field))
                    return false;
                out = std::move(t);
                return true;
            }

            bool read_test_command(const Json::Value& v, const std::string& path, TestCommand& out)
            {
                std::string        tag;
                const Json::Value* body = nullptr;
                if (!split_variant(v, path, tag, body))
                    return false;

                const std::string  p = join(path, tag.c_str());
                const Json::Value& b = *body;

                if (tag == "FragmentEntrypoint")
                    return read_entrypoint(b, p, ShaderStage::eFrag, out);
                if (tag == "VertexEntrypoint")
                    return read_entrypoint(b, p, ShaderStage::eVert, out);
                if (tag == "ComputeEntrypoint")
                    return read_entrypoint(b, p, ShaderStage::eComp, out);
                if (tag == "GeometryEntrypoint")
                    return read_entrypoint(b, p, ShaderStage::eGeom, out);

                if (tag == "DrawRect")
                {
                    cmd::DrawRect t;
                    if (!require_object(b, p) || !read_float(b, "x", p, t.x) || !read_float(b, "y", p, t.y) ||
                        !read_float(b, "width", p, t.width) || !read_float(b, "height", p, t.height))
                        return false;
                    out = t;
                    return true;
                }
                if (tag == "DrawArrays")
                    return read_draw_arrays<cmd::DrawArrays>(b, p, out);
                if (tag == "DrawArraysIndexed")
                    return read_draw_arrays<cmd::DrawArraysIndexed>(b, p, out);

                if (tag == "SSBO")
                    return read_ssbo(b, p, out);
                if (tag == "SSBOSubData")
                    return read_subdata<cmd::SsboSubData>(b, p, out);
                if (tag == "UBO")
                    return read_ubo(b, p, out);
                if (tag == "UBOSubData")
                    return read_subdata<cmd::UboSubData>(b, p, out);

                if (tag == "BufferLayout")
                {
                    cmd::BufferLayout t;
                    if (!require_object(b, p) || !read_string(b, "buffer_type", p, t.bufferType) ||
                        !read_string(b, "layout_type", p, t.layoutType))
                        return false;
                    out = std::move(t);
                    return true;
                }
                if (tag == "Push")
                {
                    cmd::Push t;
                    if (!require_object(b, p) || !read_string(b, "data_type", p, t.dataType) ||
                        !read_u32(b, "offset", p, t.offset) || !read_strings(b, "values", p, t.values))
                        return false;
                    out = std::move(t);
                    return true;
                }
                if (tag == "PushLayout")
                    return read_single_string(b, p, "layout_type", &cmd::PushLayout::layoutType, out);

                if (tag == "Compute")
                {
                    cmd::Compute t;
                    if (!require_object(b, p) || !read_u32(b, "x", p, t.x) || !read_u32(b, "y", p, t.y) ||
                        !read_u32(b, "z", p, t.z))
                        return false;
                    out = t;
                    return true;
                }

                if (tag == "Probe")
                    return read_probe<cmd::Probe>(b, p, out);
                if (tag == "RelativeProbe")
                    return read_probe<cmd::RelativeProbe>(b, p, out);

                if (tag == "Tolerance")
                {
                    cmd::Tolerance t;
                    if (!require_object(b, p) || !read_floats(b, "values", p, t.values))
                        return false;
                    out = std::move(t);
                    return true;
                }
                if (tag == "Clear")
                {
                    out = cmd::Clear {};
                    return unit(b, p);
                }

                if (tag == "DepthTestEnable")
                    return read_toggle<cmd::DepthTestEnable>(b, p, out);
                if (tag == "DepthWriteEnable")
                    return read_toggle<cmd::DepthWriteEnable>(b, p, out);
                if (tag == "StencilTestEnable")
                    return read_toggle<cmd::StencilTestEnable>(b, p, out);
                if (tag == "LogicOpEnable")
                    return read_toggle<cmd::LogicOpEnable>(b, p, out);

                if (tag == "DepthCompareOp")
                    return read_single_string(b, p, "op", &cmd::DepthCompareOp::op, out);
                if (tag == "FrontFace")
                    return read_single_string(b, p, "mode", &cmd::FrontFace::mode, out);
                if (tag == "ColorWriteMask")
                    return read_single_string(b, p, "mask", &cmd::ColorWriteMask::mask, out);
                if (tag == "LogicOp")
                    return read_single_string(b, p, "op", &cmd::LogicOp::op, out);
                if (tag == "CullMode")
                    return read_single_string(b, p, "mode", &cmd::CullMode::mode, out);

                if (tag == "StencilOp")
                {
                    cmd::StencilOp t;
                    if (!require_object(b, p) || !read_string(b, "face", p, t.face) ||
                        !read_string(b, "op_name", p, t.opName) || !read_string(b, "value", p, t.value))
                        return false;
                    out = std::move(t);
                    return true;
                }
                if (tag == "StencilReference")
                {
                    cmd::StencilReference t;
                    if (!require_object(b, p) || !read_string(b, "face", p, t.face) ||
                        !read_u32(b, "value", p, t.value))
                        return false;
                    out = std::move(t);
                    return true;
                }
                if (tag == "StencilCompareOp")
                {
                    cmd::StencilCompareOp t;
                    if (!require_object(b, p) || !read_string(b, "face", p, t.face) || !read_string(b, "op", p, t.op))
                        return false;
                    out = std::move(t);
                    return true;
                }
                if (tag == "LineWidth")
                {
                    cmd::LineWidth t;
                    if (!require_object(b, p) || !read_float(b, "width", p, t.width))
                        return false;
                    out = t;
                    return true;
                }
                if (tag == "Require")
                {
                    cmd::Require t;
                    if (!require_object(b, p) || !read_string(b, "feature", p, t.feature) ||
                        !read_strings(b, "parameters", p, t.parameters))
                        return false;
                    out = std::move(t);
                    return true;
                }

                return fail(path, "unknown test command '" + tag + "'");
            }

            // Decodes an array field element by element. `optional` lets the
            // field be absent or null.
            template<typename T, typename ReadFn>
            bool read_list(const Json::Value& root, const char* key, bool optional, std::vector<T>& out, ReadFn read)
            {
                out.clear();
                if (!root.isMember(key) || root[key].isNull())
                {
                    if (optional)
                        return true;
                    return fail(key, "missing field");
                }

                const Json::Value& arr = root[key];
                if (!require_array(arr, key))
                    return false;

                out.reserve(arr.size());
                for (Json::ArrayIndex i = 0; i < arr.size(); ++i)
                {
                    T item;
                    if (!(this->*read)(arr[i], index(key, i), item))
                        return false;
                    out.push_back(std::move(item));
                }
                return true;
            }

        private:
            Error m_Error {};
        };

        Result<Json::Value> parse_json_root(std::string_view text)
        {
            Json::CharReaderBuilder           builder;
            std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

            Json::Value root;
            std::string errors;
            if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
                return Result<Json::Value>::err({ErrorCode::eParseError, "Invalid JSON: " + errors});

            if (!root.isObject())
                return Result<Json::Value>::err({ErrorCode::eParseError, "request: expected an object"});

            return Result<Json::Value>::ok(std::move(root));
        }
    } // namespace

    Result<ShaderTestRequest> parse_request_json(std::string_view text)
    {
        auto rootR = parse_json_root(text);
        if (!rootR.isOk())
            return Result<ShaderTestRequest>::err(rootR.error());
        const Json::Value& root = rootR.value();

        RequestDecoder    d;
        ShaderTestRequest out;

        bool ok = d.read_compile_requests(root, out.compileRequests) &&
                  d.read_list(root, "requirements", true, out.spec.requirements, &RequestDecoder::read_requirement) &&
                  d.read_list(root, "passes", false, out.spec.passes, &RequestDecoder::read_pass) &&
                  d.read_list(root, "tests", false, out.spec.tests, &RequestDecoder::read_test_command);

        if (ok && root.isMember("vertex_data") && !root["vertex_data"].isNull())
        {
            std::vector<VertexData> vertexData;
            ok = d.read_list(root, "vertex_data", false, vertexData, &RequestDecoder::read_vertex_data);
            if (ok)
                out.spec.vertexData = std::move(vertexData);
        }

        if (ok && root.isMember("output_path") && !root["output_path"].isNull())
        {
            std::string outputPath;
            ok = d.as_string(root["output_path"], "output_path", outputPath);
            if (ok)
                out.outputPath = std::move(outputPath);
        }

        if (!ok)
            return Result<ShaderTestRequest>::err(d.error());

        return Result<ShaderTestRequest>::ok(std::move(out));
    }

    Result<std::vector<CompileRequest>> parse_compile_request_json(std::string_view text)
    {
        auto rootR = parse_json_root(text);
        if (!rootR.isOk())
            return Result<std::vector<CompileRequest>>::err(rootR.error());

        RequestDecoder              d;
        std::vector<CompileRequest> out;
        if (!d.read_compile_requests(rootR.value(), out))
            return Result<std::vector<CompileRequest>>::err(d.error());

        return Result<std::vector<CompileRequest>>::ok(std::move(out));
    }

    Result<std::string> read_request_text(const std::string& path)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f)
            return Result<std::string>::err({ErrorCode::eIO, "Failed to open request file: " + path});

        std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        if (f.bad())
            return Result<std::string>::err({ErrorCode::eIO, "Failed to read request file: " + path});

        return Result<std::string>::ok(std::move(text));
    }
} // namespace vshadertest
