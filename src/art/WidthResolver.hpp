// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace asciiart::art
{

/// @brief Columns subtracted from a detected terminal width to avoid wrapping.
constexpr auto TerminalMargin = std::uint32_t { 2 };

/// @brief Narrowest width used for a detected terminal.
constexpr auto MinimumDetectedWidth = std::uint32_t { 40 };

/// @brief Width used when nothing was requested and no terminal was detected.
constexpr auto FallbackWidth = std::uint32_t { 80 };

/// @brief Which input decided the output width.
enum class WidthSource : std::uint8_t
{
    User,
    AutoDetected,
    Fallback,
};

[[nodiscard]] constexpr auto widthSourceToString(WidthSource source) -> std::string_view
{
    switch (source)
    {
        case WidthSource::User: return "user";
        case WidthSource::AutoDetected: return "auto-detected";
        case WidthSource::Fallback: return "fallback";
    }
    return "unknown";
}

/// @brief The resolved output width and where it came from.
struct WidthResolution
{
    std::uint32_t width = FallbackWidth;
    WidthSource source = WidthSource::Fallback;

    constexpr auto operator==(WidthResolution const&) const -> bool = default;
};

/// @brief Decides the output width.
///
/// A user override is taken verbatim. Otherwise a detected terminal width
/// loses TerminalMargin columns (saturating at zero) and is raised to
/// MinimumDetectedWidth. Without either, FallbackWidth is used.
[[nodiscard]] constexpr auto resolveWidth(std::optional<std::uint32_t> userWidth,
                                          std::optional<std::uint32_t> detectedWidth) -> WidthResolution
{
    if (userWidth)
        return WidthResolution { .width = *userWidth, .source = WidthSource::User };

    if (detectedWidth)
    {
        auto const withMargin = *detectedWidth > TerminalMargin ? *detectedWidth - TerminalMargin : 0u;
        auto const width = withMargin < MinimumDetectedWidth ? MinimumDetectedWidth : withMargin;
        return WidthResolution { .width = width, .source = WidthSource::AutoDetected };
    }

    return WidthResolution { .width = FallbackWidth, .source = WidthSource::Fallback };
}

} // namespace asciiart::art
