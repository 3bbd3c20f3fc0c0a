#include "vshadertest/image.hpp"
#include "vshadertest/scratch.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace vshadertest
{
    namespace
    {
        Result<RgbImage> image_error(const std::string& path, const std::string& what)
        {
            return Result<RgbImage>::err({ErrorCode::eImageError, "Invalid PPM file " + path + ": " + what});
        }

        std::string lower_extension(const std::string& path)
        {
            std::string ext = std::filesystem::path(path).extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return ext;
        }

        // Last decoder failure recorded by stb_image.
        std::string stb_reason()
        {
            const char* reason = stbi_failure_reason();
            return reason ? reason : "unknown decoder error";
        }
    } // namespace

    Result<RgbImage> read_ppm(const std::string& path)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f)
            return Result<RgbImage>::err({ErrorCode::eIO, "Failed to open image " + path});

        const std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        if (f.bad())
            return Result<RgbImage>::err({ErrorCode::eIO, "Failed to read image " + path});

        if (bytes.size() < 2 || bytes[0] != 'P' || bytes[1] != '6')
            return image_error(path, "not a binary (P6) pixmap");
        if (bytes.size() > static_cast<size_t>(INT_MAX))
            return image_error(path, "file too large");

        const auto* data = reinterpret_cast<const stbi_uc*>(bytes.data());
        const int   len  = static_cast<int>(bytes.size());

        // Validate the header before anything is allocated for the pixels.
        int w = 0, h = 0, n = 0;
        if (!stbi_info_from_memory(data, len, &w, &h, &n))
            return image_error(path, stb_reason());
        if (w <= 0 || h <= 0)
            return image_error(path, "empty image");
        if (static_cast<uint32_t>(w) > kMaxImageDimension || static_cast<uint32_t>(h) > kMaxImageDimension)
            return image_error(path,
                               std::to_string(w) + "x" + std::to_string(h) + " exceeds the " +
                                   std::to_string(kMaxImageDimension) + " pixel limit");

        const uint64_t samples = static_cast<uint64_t>(w) * static_cast<uint64_t>(h) * 3;
        if (bytes.size() < samples)
            return image_error(path, "truncated pixel data");

        stbi_uc* pixels = stbi_load_from_memory(data, len, &w, &h, &n, 3);
        if (!pixels)
            return image_error(path, stb_reason());

        RgbImage img;
        img.width  = static_cast<uint32_t>(w);
        img.height = static_cast<uint32_t>(h);
        img.pixels.assign(pixels, pixels + samples);
        stbi_image_free(pixels);

        return Result<RgbImage>::ok(std::move(img));
    }

    Result<void> write_ppm(const std::string& path, const RgbImage& image)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            return Result<void>::err({ErrorCode::eIO, "Failed to open for writing: " + path});

        out << "P6\n" << image.width << " " << image.height << "\n255\n";
        out.write(reinterpret_cast<const char*>(image.pixels.data()), static_cast<std::streamsize>(image.pixels.size()));

        if (!out.good())
            return Result<void>::err({ErrorCode::eIO, "Failed to write: " + path});

        return Result<void>::ok();
    }

    Result<void> write_image(const std::string& path, const RgbImage& image)
    {
        if (image.width == 0 || image.height == 0 || image.width > kMaxImageDimension ||
            image.height > kMaxImageDimension)
            return Result<void>::err({ErrorCode::eInvalidArgument,
                                      "Image size " + std::to_string(image.width) + "x" +
                                          std::to_string(image.height) + " is out of range"});

        if (image.pixels.size() != static_cast<size_t>(image.width) * image.height * 3)
            return Result<void>::err({ErrorCode::eInvalidArgument, "Pixel buffer does not match image size"});

        const std::string ext = lower_extension(path);
        if (ext == ".ppm")
            return write_ppm(path, image);

        const int w      = static_cast<int>(image.width);
        const int h      = static_cast<int>(image.height);
        const void* data = image.pixels.data();

        int written = 0;
        if (ext == ".png")
            written = stbi_write_png(path.c_str(), w, h, 3, data, w * 3);
        else if (ext == ".bmp")
            written = stbi_write_bmp(path.c_str(), w, h, 3, data);
        else if (ext == ".tga")
            written = stbi_write_tga(path.c_str(), w, h, 3, data);
        else if (ext == ".jpg" || ext == ".jpeg")
            written = stbi_write_jpg(path.c_str(), w, h, 3, data, 95);
        else
            return Result<void>::err(
                {ErrorCode::eImageError, "Unsupported image format '" + ext + "' for " + path});

        if (!written)
            return Result<void>::err({ErrorCode::eImageError, "Failed to encode image " + path});

        return Result<void>::ok();
    }

    Result<void> normalize_image(const std::string& rasterPath, const std::string& outputPath)
    {
        auto img = read_ppm(rasterPath);
        if (!img.isOk())
            return Result<void>::err(img.error());

        auto dir = ensure_parent_directory(outputPath);
        if (!dir.isOk())
            return Result<void>::err({ErrorCode::eImageError,
                                      "Failed to create output directory: " + dir.error().message});

        return write_image(outputPath, img.value());
    }
} // namespace vshadertest
