// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <core/Types.hpp>

#include <art/Renderer.hpp>
#include <asciiart/Pipeline.hpp>
#include <tui/Terminal.hpp>

#include <cstdint>
#include <format>
#include <optional>
#include <utility>

namespace asciiart
{

App::App(AppConfig config, tui::TerminalOutput& out):
    _config(std::move(config)), _out(out), _detectWidth(tui::detectTerminalWidth)
{
}

void App::setWidthDetector(WidthDetector detector)
{
    _detectWidth = std::move(detector);
}

auto App::run() -> int
{
    if (auto result = execute(); !result)
    {
        log::debug("Run failed with {}", errorCodeName(result.error().code));
        log::error("{}", result.error().message);
        return 1;
    }
    return 0;
}

auto App::execute() -> VoidResult
{
    auto const mode = parseRenderMode(_config.mode);
    if (!mode)
        return std::unexpected(mode.error());

    // The terminal is only queried when no width was requested.
    auto detected = std::optional<std::uint32_t> {};
    if (!_config.width)
        detected = _detectWidth();
    auto const resolution = art::resolveWidth(_config.width, detected);
    log::debug("Output width {} ({})", resolution.width, art::widthSourceToString(resolution.source));

    emitWidthMessages(resolution);
    if (auto flushed = _out.flush(); !flushed)
        return flushed;

    auto output = runPipeline(_config.imagePath, resolution.width, *mode);
    if (!output)
        return std::unexpected(output.error());

    return art::renderColored(output->grid, output->processed.color, _out);
}

void App::emitWidthMessages(art::WidthResolution resolution)
{
    switch (resolution.source)
    {
        case art::WidthSource::User: break;
        case art::WidthSource::AutoDetected:
            _out.writeRaw(std::format("Using auto-detected width: {} characters", resolution.width));
            _out.newLine();
            break;
        case art::WidthSource::Fallback:
            log::warning("Unable to detect terminal size; defaulting to {} characters.", resolution.width);
            _out.writeRaw(std::format("Using fallback width: {} characters", resolution.width));
            _out.newLine();
            break;
    }
}

} // namespace asciiart
