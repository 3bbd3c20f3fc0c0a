#pragma once

#include "vshadertest/result.hpp"
#include "vshadertest/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vshadertest
{
    // ------------------------------------------------------------
    // Requirements ([require] section)
    // ------------------------------------------------------------
    namespace require
    {
        struct CooperativeMatrix
        {
            uint32_t    m = 0;
            uint32_t    n = 0;
            std::string componentType;
        };

        struct DepthStencil
        {
            std::string format;
        };

        struct Framebuffer
        {
            std::string format;
        };

        struct ShaderFloat64
        {};

        struct GeometryShader
        {};

        struct WideLines
        {};

        struct LogicOp
        {};

        struct SubgroupSize
        {
            uint32_t size = 0;
        };

        struct FragmentStoresAndAtomics
        {};

        struct BufferDeviceAddress
        {};
    } // namespace require

    using Requirement = std::variant<require::CooperativeMatrix,
                                     require::DepthStencil,
                                     require::Framebuffer,
                                     require::ShaderFloat64,
                                     require::GeometryShader,
                                     require::WideLines,
                                     require::LogicOp,
                                     require::SubgroupSize,
                                     require::FragmentStoresAndAtomics,
                                     require::BufferDeviceAddress>;

    // ------------------------------------------------------------
    // Passes (one script section each)
    // ------------------------------------------------------------
    struct VertPassthrough
    {};

    // A pass backed by a compiled SPIR-V assembly file.
    struct SpirvPass
    {
        ShaderStage stage = ShaderStage::eFrag;
        std::string path;
    };

    using Pass = std::variant<VertPassthrough, SpirvPass>;

    // ------------------------------------------------------------
    // Vertex data ([vertex data] section)
    //
    // An AttributeFormat opens a new column description; the data
    // records that follow are positional and written in input order.
    // ------------------------------------------------------------
    namespace vertex
    {
        struct AttributeFormat
        {
            uint32_t    location = 0;
            std::string format;
        };

        struct Vec2
        {
            float x = 0.0f;
            float y = 0.0f;
        };

        struct Vec3
        {
            float x = 0.0f;
            float y = 0.0f;
            float z = 0.0f;
        };

        struct Vec4
        {
            float x = 0.0f;
            float y = 0.0f;
            float z = 0.0f;
            float w = 0.0f;
        };

        struct Rgb
        {
            uint8_t r = 0;
            uint8_t g = 0;
            uint8_t b = 0;
        };

        // 0xAARRGGBB
        struct Hex
        {
            std::string value;
        };

        struct GenericComponents
        {
            std::vector<std::string> components;
        };
    } // namespace vertex

    using VertexData = std::variant<vertex::AttributeFormat,
                                    vertex::Vec2,
                                    vertex::Vec3,
                                    vertex::Vec4,
                                    vertex::Rgb,
                                    vertex::Hex,
                                    vertex::GenericComponents>;

    // ------------------------------------------------------------
    // Test commands ([test] section)
    // ------------------------------------------------------------
    namespace cmd
    {
        struct Entrypoint
        {
            ShaderStage stage = ShaderStage::eFrag;
            std::string name;
        };

        struct DrawRect
        {
            float x      = 0.0f;
            float y      = 0.0f;
            float width  = 0.0f;
            float height = 0.0f;
        };

        struct DrawArrays
        {
            std::string primitiveType;
            uint32_t    first = 0;
            uint32_t    count = 0;
        };

        struct DrawArraysIndexed
        {
            std::string primitiveType;
            uint32_t    first = 0;
            uint32_t    count = 0;
        };

        struct Ssbo
        {
            uint32_t                            binding = 0;
            std::optional<uint32_t>             size;
            std::optional<std::vector<uint8_t>> data;
            std::optional<uint32_t>             descriptorSet;
        };

        struct SsboSubData
        {
            uint32_t                 binding = 0;
            std::string              dataType;
            uint32_t                 offset = 0;
            std::vector<std::string> values;
            std::optional<uint32_t>  descriptorSet;
        };

        struct Ubo
        {
            uint32_t                binding = 0;
            std::vector<uint8_t>    data;
            std::optional<uint32_t> descriptorSet;
        };

        struct UboSubData
        {
            uint32_t                 binding = 0;
            std::string              dataType;
            uint32_t                 offset = 0;
            std::vector<std::string> values;
            std::optional<uint32_t>  descriptorSet;
        };

        struct BufferLayout
        {
            std::string bufferType; // ubo, ssbo
            std::string layoutType; // std140, std430, row_major, column_major
        };

        struct Push
        {
            std::string              dataType;
            uint32_t                 offset = 0;
            std::vector<std::string> values;
        };

        struct PushLayout
        {
            std::string layoutType;
        };

        struct Compute
        {
            uint32_t x = 1;
            uint32_t y = 1;
            uint32_t z = 1;
        };

        struct Probe
        {
            std::string              probeType;
            std::string              format;
            std::vector<std::string> args;
        };

        // Same as Probe but with normalized (0-1) coordinates.
        struct RelativeProbe
        {
            std::string              probeType;
            std::string              format;
            std::vector<std::string> args;
        };

        struct Tolerance
        {
            std::vector<float> values;
        };

        struct Clear
        {};

        struct DepthTestEnable
        {
            bool enable = false;
        };

        struct DepthWriteEnable
        {
            bool enable = false;
        };

        struct DepthCompareOp
        {
            std::string op;
        };

        struct StencilTestEnable
        {
            bool enable = false;
        };

        struct FrontFace
        {
            std::string mode;
        };

        struct StencilOp
        {
            std::string face;
            std::string opName;
            std::string value;
        };

        struct StencilReference
        {
            std::string face;
            uint32_t    value = 0;
        };

        struct StencilCompareOp
        {
            std::string face;
            std::string op;
        };

        struct ColorWriteMask
        {
            std::string mask;
        };

        struct LogicOpEnable
        {
            bool enable = false;
        };

        struct LogicOp
        {
            std::string op;
        };

        struct CullMode
        {
            std::string mode;
        };

        struct LineWidth
        {
            float width = 1.0f;
        };

        struct Require
        {
            std::string              feature;
            std::vector<std::string> parameters;
        };
    } // namespace cmd

    using TestCommand = std::variant<cmd::Entrypoint,
                                     cmd::DrawRect,
                                     cmd::DrawArrays,
                                     cmd::DrawArraysIndexed,
                                     cmd::Ssbo,
                                     cmd::SsboSubData,
                                     cmd::Ubo,
                                     cmd::UboSubData,
                                     cmd::BufferLayout,
                                     cmd::Push,
                                     cmd::PushLayout,
                                     cmd::Compute,
                                     cmd::Probe,
                                     cmd::RelativeProbe,
                                     cmd::Tolerance,
                                     cmd::Clear,
                                     cmd::DepthTestEnable,
                                     cmd::DepthWriteEnable,
                                     cmd::DepthCompareOp,
                                     cmd::StencilTestEnable,
                                     cmd::FrontFace,
                                     cmd::StencilOp,
                                     cmd::StencilReference,
                                     cmd::StencilCompareOp,
                                     cmd::ColorWriteMask,
                                     cmd::LogicOpEnable,
                                     cmd::LogicOp,
                                     cmd::CullMode,
                                     cmd::LineWidth,
                                     cmd::Require>;

    // ------------------------------------------------------------
    // Whole script description
    // ------------------------------------------------------------
    struct ShaderTestSpec
    {
        std::vector<Requirement>               requirements;
        std::vector<Pass>                      passes;
        std::optional<std::vector<VertexData>> vertexData;
        std::vector<TestCommand>               tests;
    };

    // Rejects descriptions the engine can never accept (buffers without
    // size or contents, passes without a file). Cross references to
    // compiled files are not checked here.
    Result<void> validate_spec(const ShaderTestSpec& spec);
} // namespace vshadertest
