// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <image/Decoders.hpp>

#include <png.h>

#include <csetjmp>
#include <format>
#include <string>
#include <vector>

namespace asciiart::image::detail
{

namespace
{
    /// @brief Owns the libpng read and info structs for one decode.
    struct PngReader
    {
        png_structp png = nullptr;
        png_infop info = nullptr;
        std::string lastError;

        PngReader() = default;
        PngReader(PngReader const&) = delete;
        auto operator=(PngReader const&) -> PngReader& = delete;

        ~PngReader()
        {
            if (png != nullptr)
                png_destroy_read_struct(&png, info != nullptr ? &info : nullptr, nullptr);
        }
    };

    [[noreturn]] void onPngError(png_structp png, png_const_charp message)
    {
        auto* reader = static_cast<PngReader*>(png_get_error_ptr(png));
        reader->lastError = message;
        png_longjmp(png, 1);
    }

    void onPngWarning(png_structp /*png*/, png_const_charp message)
    {
        log::debug("libpng: {}", message);
    }

    auto decodeFailed(std::string_view path, std::string_view detail) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::DecodeFailed, std::format("Failed to decode image \"{}\": {}", path, detail));
    }
} // namespace

auto decodePng(std::FILE* file, std::string_view path) -> Result<RgbaImage>
{
    auto reader = PngReader {};
    reader.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, &reader, onPngError, onPngWarning);
    if (reader.png == nullptr)
        return decodeFailed(path, "cannot allocate PNG decoder");
    reader.info = png_create_info_struct(reader.png);
    if (reader.info == nullptr)
        return decodeFailed(path, "cannot allocate PNG info");

    // Declared before setjmp and only reached through the reader afterwards.
    auto image = RgbaImage {};
    auto rows = std::vector<png_bytep> {};

    if (setjmp(png_jmpbuf(reader.png)))
        return decodeFailed(path, reader.lastError);

    png_init_io(reader.png, file);
    png_read_info(reader.png, reader.info);

    auto const width = png_get_image_width(reader.png, reader.info);
    auto const height = png_get_image_height(reader.png, reader.info);
    auto const colorType = png_get_color_type(reader.png, reader.info);
    auto const bitDepth = png_get_bit_depth(reader.png, reader.info);

    // Normalize every color type to 8-bit RGBA.
    if (bitDepth == 16)
        png_set_strip_16(reader.png);
    if (colorType == PNG_COLOR_TYPE_PALETTE)
        png_set_palette_to_rgb(reader.png);
    if (colorType == PNG_COLOR_TYPE_GRAY && bitDepth < 8)
        png_set_expand_gray_1_2_4_to_8(reader.png);
    if (png_get_valid(reader.png, reader.info, PNG_INFO_tRNS))
        png_set_tRNS_to_alpha(reader.png);
    if (colorType == PNG_COLOR_TYPE_RGB || colorType == PNG_COLOR_TYPE_GRAY || colorType == PNG_COLOR_TYPE_PALETTE)
        png_set_filler(reader.png, 0xFF, PNG_FILLER_AFTER);
    if (colorType == PNG_COLOR_TYPE_GRAY || colorType == PNG_COLOR_TYPE_GRAY_ALPHA)
        png_set_gray_to_rgb(reader.png);
    png_set_interlace_handling(reader.png);
    png_read_update_info(reader.png, reader.info);

    if (png_get_rowbytes(reader.png, reader.info) != std::size_t { width } * 4)
        return decodeFailed(path, "unexpected PNG row layout");

    image = RgbaImage::blank(width, height);
    rows.resize(height);
    for (auto y = png_uint_32 { 0 }; y < height; ++y)
        rows[y] = image.samples.data() + image.offset(0, y);

    png_read_image(reader.png, rows.data());
    png_read_end(reader.png, nullptr);

    return image;
}

} // namespace asciiart::image::detail
