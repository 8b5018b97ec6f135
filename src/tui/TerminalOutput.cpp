// SPDX-License-Identifier: Apache-2.0
#include <cerrno>
#include <cstring>
#include <format>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace asciiart::tui
{

namespace
{
    constexpr auto SgrReset = std::string_view { "\033[0m" };
}

TerminalOutput::TerminalOutput(int fd) noexcept: _fd(fd)
{
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::writeChar(char ch)
{
    _buffer += ch;
}

void TerminalOutput::writeReset()
{
    _buffer.append(SgrReset);
}

void TerminalOutput::newLine()
{
    _buffer += '\n';
}

auto TerminalOutput::flush() -> VoidResult
{
    auto remaining = std::string_view { _buffer };
    while (!remaining.empty())
    {
        auto const written = ::write(_fd, remaining.data(), remaining.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            auto const reason = std::strerror(errno);
            _buffer.clear();
            return makeError(ErrorCode::IoError, std::format("Failed to write output: {}", reason));
        }
        remaining.remove_prefix(static_cast<std::size_t>(written));
    }
    _buffer.clear();
    return {};
}

auto TerminalOutput::buffer() const noexcept -> std::string_view
{
    return _buffer;
}

} // namespace asciiart::tui
