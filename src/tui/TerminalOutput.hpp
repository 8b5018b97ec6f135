// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

#include <unistd.h>

namespace asciiart::tui
{

/// @brief Buffered writer for escape-coded text.
///
/// Text accumulates in an internal buffer and is written to the file
/// descriptor on flush(). Tests construct it with a descriptor they never
/// flush to and inspect buffer() instead.
class TerminalOutput
{
  public:
    /// @param fd File descriptor to flush to (typically STDOUT_FILENO).
    explicit TerminalOutput(int fd = STDOUT_FILENO) noexcept;

    TerminalOutput(TerminalOutput const&) = delete;
    auto operator=(TerminalOutput const&) -> TerminalOutput& = delete;

    /// @brief Appends text verbatim, escape sequences included.
    void writeRaw(std::string_view text);

    /// @brief Appends a single character.
    void writeChar(char ch);

    /// @brief Appends the SGR reset sequence (CSI 0 m).
    void writeReset();

    /// @brief Appends a line break.
    void newLine();

    /// @brief Writes the buffered text to the file descriptor and clears the buffer.
    /// @return Success or IoError if the descriptor rejects the write.
    [[nodiscard]] auto flush() -> VoidResult;

    /// @brief Returns the text buffered since the last flush.
    [[nodiscard]] auto buffer() const noexcept -> std::string_view;

  private:
    int _fd;
    std::string _buffer; ///< Output buffer for batching writes.
};

} // namespace asciiart::tui
