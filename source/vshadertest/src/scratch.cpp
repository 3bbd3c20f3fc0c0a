#include "vshadertest/scratch.hpp"
#include "vshadertest/hash.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <system_error>

#include <unistd.h>

namespace vshadertest
{
    static std::atomic<uint64_t> g_scratchCounter {0};

    std::string ScratchContext::scriptPath() const { return (std::filesystem::path(root) / scriptName).string(); }

    std::string ScratchContext::rasterPath() const { return (std::filesystem::path(root) / rasterName).string(); }

    std::string normalize_scratch_path(const ScratchContext& ctx, std::string_view path)
    {
        // Plain prefix test: "/tmp/foo" and "/tmpfoo" both count as rooted,
        // which keeps repeated normalization a no-op.
        if (path.size() >= ctx.root.size() && path.substr(0, ctx.root.size()) == ctx.root)
            return std::string(path);

        std::string out = ctx.root;
        if (out.empty() || out.back() != '/')
            out.push_back('/');
        out.append(path);
        return out;
    }

    Result<void> ensure_parent_directory(const std::string& path)
    {
        const auto parent = std::filesystem::path(path).parent_path();
        if (parent.empty())
            return Result<void>::ok();

        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
            return Result<void>::err(
                {ErrorCode::eIO, "Failed to create directory " + parent.string() + ": " + ec.message()});

        return Result<void>::ok();
    }

    ScratchContext make_unique_scratch(const ScratchContext& base, std::string_view requestText)
    {
        const uint64_t pid     = static_cast<uint64_t>(::getpid());
        const uint64_t counter = g_scratchCounter.fetch_add(1);

        uint64_t h = xxhash64(requestText);
        h          = xxhash64(&pid, sizeof(pid), h);
        h          = xxhash64(&counter, sizeof(counter), h);

        ScratchContext out = base;
        out.root           = (std::filesystem::path(base.root) / ("vshadertest-" + hash_hex(h))).string();
        return out;
    }
} // namespace vshadertest
