#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace assetcat::thumbd {

// Image is a packed 8-bit RGB or RGBA raster, rows top to bottom.
struct Image {
    int width = 0;
    int height = 0;
    int channels = 3;
    std::vector<uint8_t> pixels;

    Image() = default;
    Image(int w, int h, int c)
        : width(w), height(h), channels(c),
          pixels(static_cast<size_t>(w > 0 ? w : 0) * static_cast<size_t>(h > 0 ? h : 0) *
                 static_cast<size_t>(c > 0 ? c : 0)) {}

    uint8_t* at(int x, int y) {
        return pixels.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) +
                                static_cast<size_t>(x)) * static_cast<size_t>(channels);
    }
};

// write_png encodes img to path in one call. Throws RenderBackendError for a
// malformed image and IOError when the file cannot be written.
void write_png(const std::filesystem::path& path, const Image& img);

// is_png reports whether path starts with a PNG header libpng accepts.
bool is_png(const std::filesystem::path& path);

} // namespace assetcat::thumbd
