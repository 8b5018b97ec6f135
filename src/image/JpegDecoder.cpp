// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <image/Decoders.hpp>

#include <array>
#include <csetjmp>
#include <cstdio>
#include <format>
#include <string>
#include <vector>

#include <jpeglib.h>

namespace asciiart::image::detail
{

namespace
{
    /// @brief libjpeg error manager that jumps back into decodeJpeg() instead of exiting.
    struct JpegErrorManager
    {
        jpeg_error_mgr base {};
        std::jmp_buf jumpBuffer {};
        std::string lastError;
    };

    [[noreturn]] void onJpegError(j_common_ptr cinfo)
    {
        auto* manager = static_cast<JpegErrorManager*>(cinfo->client_data);
        auto buffer = std::array<char, JMSG_LENGTH_MAX> {};
        (*cinfo->err->format_message)(cinfo, buffer.data());
        manager->lastError = buffer.data();
        std::longjmp(manager->jumpBuffer, 1);
    }

    void onJpegMessage(j_common_ptr cinfo, int msgLevel)
    {
        // Only warnings (level -1) are interesting; trace messages are dropped.
        if (msgLevel >= 0)
            return;
        auto buffer = std::array<char, JMSG_LENGTH_MAX> {};
        (*cinfo->err->format_message)(cinfo, buffer.data());
        log::debug("libjpeg: {}", buffer.data());
    }

    /// @brief Owns a decompress struct and destroys it on scope exit.
    struct JpegDecompressor
    {
        jpeg_decompress_struct cinfo {};
        bool created = false;

        JpegDecompressor() = default;
        JpegDecompressor(JpegDecompressor const&) = delete;
        auto operator=(JpegDecompressor const&) -> JpegDecompressor& = delete;

        ~JpegDecompressor()
        {
            if (created)
                jpeg_destroy_decompress(&cinfo);
        }
    };
} // namespace

auto decodeJpeg(std::FILE* file, std::string_view path) -> Result<RgbaImage>
{
    auto errors = JpegErrorManager {};
    auto decompressor = JpegDecompressor {};
    auto image = RgbaImage {};
    auto scanline = std::vector<JSAMPLE> {};

    decompressor.cinfo.err = jpeg_std_error(&errors.base);
    decompressor.cinfo.client_data = &errors;
    errors.base.error_exit = onJpegError;
    errors.base.emit_message = onJpegMessage;

    if (setjmp(errors.jumpBuffer))
        return makeError(ErrorCode::DecodeFailed,
                         std::format("Failed to decode image \"{}\": {}", path, errors.lastError));

    jpeg_create_decompress(&decompressor.cinfo);
    decompressor.created = true;
    jpeg_stdio_src(&decompressor.cinfo, file);
    jpeg_read_header(&decompressor.cinfo, TRUE);
    decompressor.cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&decompressor.cinfo);

    auto const width = decompressor.cinfo.output_width;
    auto const height = decompressor.cinfo.output_height;
    auto const components = static_cast<std::size_t>(decompressor.cinfo.output_components);

    image = RgbaImage::blank(width, height);
    scanline.resize(std::size_t { width } * components);

    while (decompressor.cinfo.output_scanline < height)
    {
        auto const y = decompressor.cinfo.output_scanline;
        auto* row = scanline.data();
        jpeg_read_scanlines(&decompressor.cinfo, &row, 1);

        for (auto x = JDIMENSION { 0 }; x < width; ++x)
        {
            auto out = image.pixel(x, y);
            auto const* in = scanline.data() + std::size_t { x } * components;
            out[0] = in[0];
            out[1] = in[1];
            out[2] = in[2];
            out[3] = 0xFF;
        }
    }

    jpeg_finish_decompress(&decompressor.cinfo);
    return image;
}

} // namespace asciiart::image::detail
