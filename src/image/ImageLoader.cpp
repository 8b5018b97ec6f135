// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <image/Decoders.hpp>
#include <image/ImageLoader.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <memory>
#include <string>

namespace asciiart::image
{

namespace
{
    constexpr auto PngSignature = std::array<std::uint8_t, 8> { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n' };
    constexpr auto JpegSignature = std::array<std::uint8_t, 3> { 0xFF, 0xD8, 0xFF };

    struct FileCloser
    {
        void operator()(std::FILE* file) const noexcept { std::fclose(file); }
    };

    using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

    auto ioError(std::string_view path, int errnum) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::IoError,
                         std::format("I/O error while accessing \"{}\": {}", path, std::strerror(errnum)));
    }

    auto openImageFile(std::string_view path) -> Result<FilePtr>
    {
        errno = 0;
        auto file = FilePtr(std::fopen(std::string(path).c_str(), "rb"));
        if (file)
            return file;
        if (errno == ENOENT || errno == ENOTDIR)
            return makeError(ErrorCode::FileNotFound, std::format("Could not find image file \"{}\".", path));
        return ioError(path, errno);
    }
} // namespace

auto detectFormat(std::span<const std::uint8_t> header) -> ImageFormat
{
    if (header.size() >= PngSignature.size() && std::ranges::equal(header.first(PngSignature.size()), PngSignature))
        return ImageFormat::Png;
    if (header.size() >= JpegSignature.size()
        && std::ranges::equal(header.first(JpegSignature.size()), JpegSignature))
        return ImageFormat::Jpeg;
    return ImageFormat::Unknown;
}

auto loadImage(std::string_view path) -> Result<RgbaImage>
{
    auto file = openImageFile(path);
    if (!file)
        return std::unexpected(file.error());

    auto header = std::array<std::uint8_t, PngSignature.size()> {};
    errno = 0;
    auto const headerSize = std::fread(header.data(), 1, header.size(), file->get());
    if (std::ferror(file->get()))
        return ioError(path, errno != 0 ? errno : EIO);
    if (std::fseek(file->get(), 0, SEEK_SET) != 0)
        return ioError(path, errno);

    auto decoded = Result<RgbaImage> {};
    switch (detectFormat(std::span(header).first(headerSize)))
    {
        case ImageFormat::Png: decoded = detail::decodePng(file->get(), path); break;
        case ImageFormat::Jpeg: decoded = detail::decodeJpeg(file->get(), path); break;
        case ImageFormat::Unknown:
            return makeError(ErrorCode::UnsupportedFormat,
                             std::format("Unsupported image format for file \"{}\".", path));
    }

    if (decoded)
        log::debug("Decoded \"{}\": {}x{}", path, decoded->width, decoded->height);
    return decoded;
}

} // namespace asciiart::image
