#include "vshadertest/line_reader.hpp"

#include <fstream>
#include <sstream>
#include <string_view>
#include <utility>

namespace vshadertest
{
    Result<void> apply_token_replacements(std::string& line, const std::vector<TokenReplacement>& replacements)
    {
        if (replacements.empty())
            return Result<void>::ok();

        size_t count = 0;
        size_t pos   = 0;

        while (pos < line.size())
        {
            const TokenReplacement* match = nullptr;
            for (const auto& tr : replacements)
            {
                if (!tr.token.empty() && std::string_view(line).substr(pos).starts_with(tr.token))
                {
                    match = &tr;
                    break;
                }
            }

            if (!match)
            {
                ++pos;
                continue;
            }

            if (++count > kMaxTokenReplacementsPerLine)
                return Result<void>::err({ErrorCode::eSubstitutionError,
                                          "The token replacements cause an infinite loop (token '" + match->token +
                                              "')."});

            line.replace(pos, match->token.size(), match->replacement);
        }

        return Result<void>::ok();
    }

    LineReader::LineReader(Source source) : m_Source(std::move(source)) {}

    Result<void> LineReader::open()
    {
        m_Opened = true;

        if (const auto* file = std::get_if<Source::File>(&m_Source.data()))
        {
            auto stream = std::make_unique<std::ifstream>(file->filename, std::ios::binary);
            if (!*stream)
                return Result<void>::err({ErrorCode::eIO, "Failed to open " + file->filename});
            m_Stream = std::move(stream);
        }
        else
        {
            const auto& str = std::get<Source::String>(m_Source.data());
            m_Stream        = std::make_unique<std::istringstream>(str.text);
        }

        return Result<void>::ok();
    }

    Result<std::optional<std::string>> LineReader::read_line()
    {
        if (!m_Opened)
        {
            auto o = open();
            if (!o.isOk())
                return Result<std::optional<std::string>>::err(o.error());
        }

        if (!m_Stream)
            return Result<std::optional<std::string>>::ok(std::nullopt);

        std::string line;
        if (!std::getline(*m_Stream, line))
        {
            if (m_Stream->bad())
                return Result<std::optional<std::string>>::err(
                    {ErrorCode::eIO, "Read error after line " + std::to_string(m_LineNumber)});
            m_Stream.reset();
            return Result<std::optional<std::string>>::ok(std::nullopt);
        }

        ++m_LineNumber;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        auto r = apply_token_replacements(line, m_Source.token_replacements());
        if (!r.isOk())
            return Result<std::optional<std::string>>::err(
                {r.error().code, "line " + std::to_string(m_LineNumber) + ": " + r.error().message});

        return Result<std::optional<std::string>>::ok(std::move(line));
    }

    Result<std::vector<std::string>> read_all_lines(const Source& source)
    {
        LineReader               reader(source);
        std::vector<std::string> lines;

        for (;;)
        {
            auto r = reader.read_line();
            if (!r.isOk())
                return Result<std::vector<std::string>>::err(r.error());
            if (!r.value())
                break;
            lines.push_back(std::move(*r.value()));
        }

        return Result<std::vector<std::string>>::ok(std::move(lines));
    }
} // namespace vshadertest
