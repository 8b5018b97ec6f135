// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <art/WidthResolver.hpp>
#include <asciiart/Config.hpp>
#include <tui/TerminalOutput.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace asciiart
{

/// @brief Runs one image-to-text conversion from a finished configuration.
class App
{
  public:
    /// @brief Returns the terminal width, or std::nullopt when there is no terminal.
    using WidthDetector = std::function<std::optional<std::uint32_t>()>;

    /// @brief Constructs the application with the given configuration.
    /// @param config The run configuration.
    /// @param out Where provenance messages and the colored art are written.
    App(AppConfig config, tui::TerminalOutput& out);

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Replaces the terminal query used when no width was requested.
    void setWidthDetector(WidthDetector detector);

    /// @brief Resolves the width, converts the image and renders it.
    ///
    /// On failure the error is logged and nothing further is written.
    /// @return Exit code: 0 on success, 1 on any failure.
    [[nodiscard]] auto run() -> int;

  private:
    void emitWidthMessages(art::WidthResolution resolution);
    [[nodiscard]] auto execute() -> VoidResult;

    AppConfig _config;
    tui::TerminalOutput& _out;
    WidthDetector _detectWidth;
};

} // namespace asciiart
