#pragma once

#include "vshadertest/result.hpp"
#include "vshadertest/source.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vshadertest
{
    // Upper bound on substitutions within one line. Reaching it means the
    // replacements are cyclic or keep growing the line.
    inline constexpr size_t kMaxTokenReplacementsPerLine = 1000;

    // Applies `replacements` to `line` in place. At each position the
    // first declared token that matches is substituted and the position is
    // scanned again, so tokens produced by a replacement are expanded too.
    Result<void> apply_token_replacements(std::string& line, const std::vector<TokenReplacement>& replacements);

    // ------------------------------------------------------------
    // LineReader
    //
    // Reads a Source one physical line at a time with its token
    // replacements applied. Line terminators are stripped. The reader
    // owns its Source.
    // ------------------------------------------------------------
    class LineReader
    {
    public:
        explicit LineReader(Source source);

        // Returns the next line, std::nullopt at end of input, or an error
        // (unreadable file, runaway substitution).
        Result<std::optional<std::string>> read_line();

        // 1-based number of the line last returned.
        size_t line_number() const { return m_LineNumber; }

    private:
        Result<void> open();

        Source                        m_Source;
        std::unique_ptr<std::istream> m_Stream;
        size_t                        m_LineNumber = 0;
        bool                          m_Opened     = false;
    };

    // Reads every line of the source with replacements applied.
    Result<std::vector<std::string>> read_all_lines(const Source& source);
} // namespace vshadertest
