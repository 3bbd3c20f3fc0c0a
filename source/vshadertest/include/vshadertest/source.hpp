#pragma once

#include "vshadertest/result.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace vshadertest
{
    // Any occurrence of `token` in a line read from a Source is replaced
    // with `replacement`. Replacements can themselves contain tokens.
    struct TokenReplacement
    {
        std::string token;
        std::string replacement;
    };

    // ------------------------------------------------------------
    // Source
    //
    // Where a script is read from: a file or an in-memory string, plus
    // the ordered token replacements to apply while reading it.
    // ------------------------------------------------------------
    class Source
    {
    public:
        struct File
        {
            std::string filename;
        };

        struct String
        {
            std::string text;
        };

        using Data = std::variant<File, String>;

        static Source from_string(std::string text);
        static Source from_file(std::string filename);

        // Empty tokens are rejected: they would match at every position.
        Result<void> add_token_replacement(std::string token, std::string replacement);

        const std::vector<TokenReplacement>& token_replacements() const { return m_TokenReplacements; }
        const Data&                          data() const { return m_Data; }

    private:
        explicit Source(Data data) : m_Data(std::move(data)) {}

        std::vector<TokenReplacement> m_TokenReplacements;
        Data                          m_Data;
    };
} // namespace vshadertest
