#pragma once

#include "vshadertest/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vshadertest
{
    // Largest width or height accepted when decoding or encoding.
    inline constexpr uint32_t kMaxImageDimension = 16384;

    // Tightly packed 8-bit RGB, rows top to bottom.
    struct RgbImage
    {
        uint32_t             width  = 0;
        uint32_t             height = 0;
        std::vector<uint8_t> pixels;
    };

    // Decodes the binary (P6) pixmap the engine dumps. The header is
    // checked against kMaxImageDimension and the file size before any
    // pixel memory is allocated.
    Result<RgbImage> read_ppm(const std::string& path);

    Result<void> write_ppm(const std::string& path, const RgbImage& image);

    // Encodes by file extension: .png, .bmp, .tga, .jpg/.jpeg or .ppm.
    Result<void> write_image(const std::string& path, const RgbImage& image);

    // Reads the raster the engine captured and stores it at `outputPath`,
    // creating missing parent directories.
    Result<void> normalize_image(const std::string& rasterPath, const std::string& outputPath);
} // namespace vshadertest
