#include "assetcat/thumbd_png.h"
#include "assetcat/errors.h"

#include <png.h>

#include <format>

namespace fs = std::filesystem;

namespace assetcat::thumbd {

void write_png(const fs::path& path, const Image& img) {
    if (img.width <= 0 || img.height <= 0 || (img.channels != 3 && img.channels != 4))
        throw RenderBackendError(std::format("png: cannot encode a {}x{} image with {} channels",
                                             img.width, img.height, img.channels));
    const size_t stride = static_cast<size_t>(img.width) * static_cast<size_t>(img.channels);
    if (img.pixels.size() != stride * static_cast<size_t>(img.height))
        throw RenderBackendError(std::format("png: {} pixel bytes for a {}x{}x{} image",
                                             img.pixels.size(), img.width, img.height, img.channels));

    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(img.width);
    image.height = static_cast<png_uint_32>(img.height);
    image.format = img.channels == 4 ? PNG_FORMAT_RGBA : PNG_FORMAT_RGB;

    // libpng releases the image itself on both success and failure.
    if (!png_image_write_to_file(&image, path.string().c_str(), 0, img.pixels.data(),
                                 static_cast<png_int_32>(stride), nullptr))
        throw IOError(std::format("png: cannot write {}: {}", path.string(), image.message));
}

bool is_png(const fs::path& path) {
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_file(&image, path.string().c_str())) return false;
    const bool ok = image.width > 0 && image.height > 0;
    png_image_free(&image);
    return ok;
}

} // namespace assetcat::thumbd
