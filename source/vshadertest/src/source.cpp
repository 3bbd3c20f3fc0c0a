#include "vshadertest/source.hpp"

#include <utility>

namespace vshadertest
{
    Source Source::from_string(std::string text) { return Source(String {std::move(text)}); }

    Source Source::from_file(std::string filename) { return Source(File {std::move(filename)}); }

    Result<void> Source::add_token_replacement(std::string token, std::string replacement)
    {
        if (token.empty())
            return Result<void>::err({ErrorCode::eInvalidArgument, "Token replacement with an empty token."});

        m_TokenReplacements.push_back({std::move(token), std::move(replacement)});
        return Result<void>::ok();
    }
} // namespace vshadertest
