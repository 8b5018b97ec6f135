// SPDX-License-Identifier: Apache-2.0
#include <asciiart/App.hpp>
#include <asciiart/Pipeline.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "TestImages.hpp"

using namespace asciiart;

namespace
{
struct LogLine
{
    log::Level level;
    std::string message;
};

/// @brief Captures log output for the lifetime of the object.
class LogCapture
{
  public:
    LogCapture()
    {
        log::setCallback([this](log::Level level, std::string_view message) {
            lines.push_back(LogLine { level, std::string(message) });
        });
    }
    ~LogCapture() { log::setCallback({}); }

    LogCapture(LogCapture const&) = delete;
    auto operator=(LogCapture const&) -> LogCapture& = delete;

    std::vector<LogLine> lines;
};

/// @brief Runs the app with its output going to a temporary file and returns what was written.
struct RunResult
{
    int exitCode = 0;
    std::string output;
};

auto runApp(AppConfig config, App::WidthDetector detector = [] { return std::optional<std::uint32_t> {}; })
    -> RunResult
{
    auto* file = std::tmpfile();
    REQUIRE(file != nullptr);

    auto out = tui::TerminalOutput { fileno(file) };
    auto app = App(std::move(config), out);
    app.setWidthDetector(std::move(detector));

    auto result = RunResult {};
    result.exitCode = app.run();

    std::rewind(file);
    auto chunk = std::array<char, 4096> {};
    while (auto const n = std::fread(chunk.data(), 1, chunk.size(), file))
        result.output.append(chunk.data(), n);
    std::fclose(file);
    return result;
}

/// @brief Expected render output for a grid where every cell has the same code and character.
auto uniformArt(std::string_view code, char ch, std::uint32_t width, std::uint32_t height) -> std::string
{
    auto art = std::string {};
    for (auto y = std::uint32_t { 0 }; y < height; ++y)
    {
        for (auto x = std::uint32_t { 0 }; x < width; ++x)
        {
            art += code;
            art += ch;
        }
        art += "\033[0m\n";
    }
    art += "\033[0m";
    return art;
}
} // namespace

TEST_CASE("App: black image renders as black spaces", "[app]")
{
    auto const file = test::TempFile("asciiart_test_black.png");
    REQUIRE(test::writePng(file.path(), image::RgbaImage::filled(6, 4, { 0, 0, 0, 255 })));

    auto config = AppConfig {};
    config.imagePath = file.string();
    config.width = 6;

    // 6 wide, round(6 * 4 / 6 / 2) = 2 tall.
    auto const result = runApp(std::move(config));
    CHECK(result.exitCode == 0);
    CHECK(result.output == uniformArt("\033[30m", ' ', 6, 2));
}

TEST_CASE("App: white image renders as bright white @", "[app]")
{
    auto const file = test::TempFile("asciiart_test_white.png");
    REQUIRE(test::writePng(file.path(), image::RgbaImage::filled(10, 10, { 255, 255, 255, 255 })));

    auto config = AppConfig {};
    config.imagePath = file.string();
    config.width = 8;

    auto const result = runApp(std::move(config));
    CHECK(result.exitCode == 0);
    CHECK(result.output == uniformArt("\033[97m", '@', 8, 4));
}

TEST_CASE("App: edge mode on a flat image is blank", "[app]")
{
    auto const file = test::TempFile("asciiart_test_flat_edge.png");
    REQUIRE(test::writePng(file.path(), image::RgbaImage::filled(10, 10, { 255, 255, 255, 255 })));

    auto config = AppConfig {};
    config.imagePath = file.string();
    config.width = 8;
    config.mode = "edge";

    auto const result = runApp(std::move(config));
    CHECK(result.exitCode == 0);
    CHECK(result.output == uniformArt("\033[97m", ' ', 8, 4));
}

TEST_CASE("App: invalid mode fails naming the value", "[app]")
{
    auto const file = test::TempFile("asciiart_test_mode.png");
    REQUIRE(test::writePng(file.path(), image::RgbaImage::filled(4, 4, { 10, 20, 30, 255 })));

    auto capture = LogCapture {};
    auto config = AppConfig {};
    config.imagePath = file.string();
    config.width = 40;
    config.mode = "invalid";

    auto const result = runApp(std::move(config));
    CHECK(result.exitCode == 1);
    CHECK(result.output.empty());
    REQUIRE(capture.lines.size() == 1);
    CHECK(capture.lines[0].level == log::Level::Error);
    CHECK(capture.lines[0].message == "Unknown mode 'invalid'. Use 'standard' or 'edge'.");
}

TEST_CASE("App: missing image reports a user-friendly error", "[app]")
{
    auto capture = LogCapture {};
    auto config = AppConfig {};
    config.imagePath = "tests/data/does-not-exist.png";
    config.width = 80;

    auto const result = runApp(std::move(config));
    CHECK(result.exitCode == 1);
    CHECK(result.output.empty());
    REQUIRE(!capture.lines.empty());
    CHECK(capture.lines.back().message == "Could not find image file \"tests/data/does-not-exist.png\".");
}

TEST_CASE("App: zero width is rejected before resizing", "[app]")
{
    auto const file = test::TempFile("asciiart_test_zero_width.png");
    REQUIRE(test::writePng(file.path(), image::RgbaImage::filled(4, 4, { 10, 20, 30, 255 })));

    auto capture = LogCapture {};
    auto config = AppConfig {};
    config.imagePath = file.string();
    config.width = 0;

    auto const result = runApp(std::move(config));
    CHECK(result.exitCode == 1);
    REQUIRE(!capture.lines.empty());
    CHECK(capture.lines.back().message == "Target width must be greater than zero.");
}

TEST_CASE("App: oversized width fails with one error line", "[app]")
{
    auto const file = test::TempFile("asciiart_test_huge_width.png");
    REQUIRE(test::writePng(file.path(), image::RgbaImage::filled(4, 4, { 10, 20, 30, 255 })));

    auto capture = LogCapture {};
    auto config = AppConfig {};
    config.imagePath = file.string();
    config.width = 4'000'000'000u;

    auto const result = runApp(std::move(config));
    CHECK(result.exitCode == 1);
    CHECK(result.output.empty());
    REQUIRE(capture.lines.size() == 1);
    CHECK(capture.lines[0].level == log::Level::Error);
    CHECK(capture.lines[0].message.starts_with("Target size 4000000000x2000000000 exceeds"));
}

TEST_CASE("App: width provenance messages", "[app]")
{
    auto const file = test::TempFile("asciiart_test_provenance.png");
    REQUIRE(test::writePng(file.path(), image::RgbaImage::filled(4, 2, { 0, 0, 0, 255 })));

    auto capture = LogCapture {};
    auto config = AppConfig {};
    config.imagePath = file.string();

    SECTION("fallback warns and announces the default")
    {
        auto const result = runApp(config);
        CHECK(result.exitCode == 0);
        CHECK(result.output.starts_with("Using fallback width: 80 characters\n"));
        REQUIRE(!capture.lines.empty());
        CHECK(capture.lines[0].level == log::Level::Warning);
        CHECK(capture.lines[0].message == "Unable to detect terminal size; defaulting to 80 characters.");
    }

    SECTION("auto-detected width keeps a margin")
    {
        auto const result = runApp(config, [] { return std::optional<std::uint32_t> { 100 }; });
        CHECK(result.exitCode == 0);
        CHECK(result.output.starts_with("Using auto-detected width: 98 characters\n"));
        CHECK(capture.lines.empty());
    }

    SECTION("narrow terminal is raised to the minimum")
    {
        auto const result = runApp(config, [] { return std::optional<std::uint32_t> { 30 }; });
        CHECK(result.output.starts_with("Using auto-detected width: 40 characters\n"));
    }

    SECTION("user width prints nothing and skips detection")
    {
        config.width = 12;
        auto detectorCalled = false;
        auto const result = runApp(config, [&] {
            detectorCalled = true;
            return std::optional<std::uint32_t> { 100 };
        });
        CHECK(result.exitCode == 0);
        CHECK(!detectorCalled);
        CHECK(result.output == uniformArt("\033[30m", ' ', 12, 3));
    }
}

TEST_CASE("runPipeline: grid matches the processed buffers", "[app][pipeline]")
{
    auto const file = test::TempFile("asciiart_test_pipeline.png");
    REQUIRE(test::writePng(file.path(), image::RgbaImage::filled(20, 10, { 90, 90, 90, 255 })));

    for (auto const mode: { RenderMode::Standard, RenderMode::Edge })
    {
        auto const output = runPipeline(file.string(), 16, mode);
        REQUIRE(output.has_value());
        CHECK(output->grid.size() == output->processed.color.height);
        CHECK(output->processed.gray.height == 4);
        for (auto const& row: output->grid)
            CHECK(row.size() == 16);
    }
}
