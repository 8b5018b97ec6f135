// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>

#include <unistd.h>

namespace asciiart::tui
{

/// @brief Terminal dimensions in character cells.
struct TerminalSize
{
    std::uint32_t columns = 0;
    std::uint32_t rows = 0;
};

/// @brief Queries the window size of the terminal attached to a descriptor.
/// @param fd Descriptor to query, stdout by default.
/// @return The size, or std::nullopt when the descriptor is not a terminal or
///         the terminal reports zero columns.
[[nodiscard]] auto queryTerminalSize(int fd = STDOUT_FILENO) -> std::optional<TerminalSize>;

/// @brief Convenience: the column count of the terminal on stdout, if any.
[[nodiscard]] auto detectTerminalWidth() -> std::optional<std::uint32_t>;

} // namespace asciiart::tui
