#include "vshadertest/pipeline.hpp"

#include <string>

namespace vshadertest
{
    Result<void> validate_spec(const ShaderTestSpec& spec)
    {
        for (size_t i = 0; i < spec.passes.size(); ++i)
        {
            const auto* sp = std::get_if<SpirvPass>(&spec.passes[i]);
            if (sp && sp->path.empty())
                return Result<void>::err({ErrorCode::eInvalidArgument,
                                          "Pass " + std::to_string(i) + " (" + stage_display_name(sp->stage) +
                                              ") has no SPIR-V assembly path."});
        }

        for (size_t i = 0; i < spec.tests.size(); ++i)
        {
            const auto& t = spec.tests[i];

            if (const auto* ssbo = std::get_if<cmd::Ssbo>(&t))
            {
                if (!ssbo->size && !ssbo->data)
                    return Result<void>::err(
                        {ErrorCode::eInvalidArgument,
                         "Test command " + std::to_string(i) + ": ssbo binding " + std::to_string(ssbo->binding) +
                             " needs a size or initial data."});
                if (ssbo->data && ssbo->data->empty() && !ssbo->size)
                    return Result<void>::err({ErrorCode::eInvalidArgument,
                                              "Test command " + std::to_string(i) + ": ssbo binding " +
                                                  std::to_string(ssbo->binding) + " has empty initial data."});
            }
            else if (const auto* ubo = std::get_if<cmd::Ubo>(&t))
            {
                if (ubo->data.empty())
                    return Result<void>::err({ErrorCode::eInvalidArgument,
                                              "Test command " + std::to_string(i) + ": ubo binding " +
                                                  std::to_string(ubo->binding) + " has no data."});
            }
        }

        return Result<void>::ok();
    }
} // namespace vshadertest
