// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <asciiart/App.hpp>
#include <asciiart/Config.hpp>
#include <tui/TerminalOutput.hpp>

#include <CLI/CLI.hpp>

#include <cstdint>
#include <string>

#ifndef ASCIIART_VERSION
    #define ASCIIART_VERSION "0.0.0"
#endif

int main(int argc, char** argv)
{
    auto app = CLI::App { "asciiart - Convert images to colorized ASCII art in the terminal" };
    app.name("asciiart");

    auto imagePath = std::string {};
    auto configPath = std::string {};
    auto width = std::uint32_t { 0 };
    auto mode = std::string {};
    auto verbose = false;

    app.add_option("IMAGE", imagePath, "Path to the input image file (PNG or JPEG)")->required();
    auto* widthOption = app.add_option("--width", width, "Override the output width (characters)");
    auto* modeOption = app.add_option("--mode", mode, "Rendering mode: \"standard\" or \"edge\" [default: standard]");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.set_version_flag("--version", ASCIIART_VERSION);

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        asciiart::log::setLevel(asciiart::log::Level::Debug);

    // Load config
    auto configResult = configPath.empty() ? asciiart::loadConfig() : asciiart::loadConfigFromFile(configPath);

    if (!configResult)
    {
        asciiart::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    config.imagePath = imagePath;
    if (widthOption->count() > 0)
        config.width = width;
    if (modeOption->count() > 0)
        config.mode = mode;
    if (verbose)
        config.verbose = true;

    asciiart::log::setLevel(config.verbose ? asciiart::log::Level::Debug : config.logLevel);

    auto output = asciiart::tui::TerminalOutput { STDOUT_FILENO };
    auto application = asciiart::App(std::move(config), output);
    return application.run();
}
