// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <art/CharGrid.hpp>
#include <image/Image.hpp>
#include <tui/TerminalOutput.hpp>

namespace asciiart::art
{

/// @brief Writes a character grid colored after the co-located source pixels.
///
/// Every cell is emitted as the escape code of its quantized color followed by
/// the character. Each row ends with a reset and a line break, and one more
/// reset follows the last row. The output is flushed after every row when
/// `flushPerRow` is set.
///
/// @param grid The characters to draw.
/// @param colors Color source; must be at least as wide and tall as the grid.
/// @param out Where the escape-coded text goes.
/// @param flushPerRow Flush `out` after each row.
/// @return Success, InvalidDimensions if the color source does not cover the grid,
///         or the IoError of a failed flush.
[[nodiscard]] auto renderColored(CharGrid const& grid,
                                 image::RgbImage const& colors,
                                 tui::TerminalOutput& out,
                                 bool flushPerRow = true) -> VoidResult;

} // namespace asciiart::art
