#pragma once

#include <cstdint>

namespace vshadertest
{
    // ------------------------------------------------------------
    // Shader stage
    // ------------------------------------------------------------
    enum class ShaderStage : uint8_t
    {
        eVert = 0,
        eFrag,
        eTesc,
        eTese,
        eGeom,
        eComp
    };

    // Value passed to glslc as -fshader-stage=<name>.
    inline const char* stage_name(ShaderStage s)
    {
        switch (s)
        {
            case ShaderStage::eVert:
                return "vert";
            case ShaderStage::eFrag:
                return "frag";
            case ShaderStage::eTesc:
                return "tesc";
            case ShaderStage::eTese:
                return "tese";
            case ShaderStage::eGeom:
                return "geom";
            case ShaderStage::eComp:
                return "comp";
            default:
                return "unknown";
        }
    }

    // Human readable stage name as used in script section headers.
    inline const char* stage_display_name(ShaderStage s)
    {
        switch (s)
        {
            case ShaderStage::eVert:
                return "vertex";
            case ShaderStage::eFrag:
                return "fragment";
            case ShaderStage::eTesc:
                return "tessellation control";
            case ShaderStage::eTese:
                return "tessellation evaluation";
            case ShaderStage::eGeom:
                return "geometry";
            case ShaderStage::eComp:
                return "compute";
            default:
                return "unknown";
        }
    }
} // namespace vshadertest
