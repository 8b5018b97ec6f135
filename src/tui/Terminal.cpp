// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <unistd.h>

#include <core/Log.hpp>
#include <tui/Terminal.hpp>

namespace asciiart::tui
{

auto queryTerminalSize(int fd) -> std::optional<TerminalSize>
{
    if (::isatty(fd) == 0)
        return std::nullopt;

    auto ws = winsize {};
    if (ioctl(fd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0)
        return std::nullopt;

    return TerminalSize { .columns = ws.ws_col, .rows = ws.ws_row };
}

auto detectTerminalWidth() -> std::optional<std::uint32_t>
{
    auto const size = queryTerminalSize();
    if (!size)
    {
        log::debug("stdout is not a terminal or reports no size");
        return std::nullopt;
    }
    log::debug("Terminal size: {}x{}", size->columns, size->rows);
    return size->columns;
}

} // namespace asciiart::tui
