// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <narrator/App.hpp>
#include <narrator/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "narrator - Audiobook generation from pre-segmented text" };

    auto options = narrator::RunOptions {};
    auto configPath = std::string {};
    auto format = std::string {};
    auto bitrate = 0u;
    auto parallel = 0;
    auto storeDir = std::string {};
    auto verbose = false;
    auto logLevel = std::string {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-b,--book", options.bookPath, "Book manifest (JSON) to narrate")->required()->check(CLI::ExistingFile);
    app.add_option("-o,--output", options.outputPath, "Output file of the exported book");
    app.add_option("-f,--format", format, "Output format (wav|mp3|m4b)")->check(CLI::IsMember({ "wav", "mp3", "m4b" }));
    app.add_option("--bitrate", bitrate, "Bitrate in kbit/s for compressed formats");
    app.add_option("-j,--parallel", parallel, "Concurrent synthesis calls per chapter");
    app.add_option("--store", storeDir, "Directory of the segment store");
    app.add_flag("--export-only", options.exportOnly, "Export previously generated chapters without synthesizing");
    app.add_option("--overlays", options.overlayDirectory, "Directory for chapter audio with EPUB3 media overlays");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");

    CLI11_PARSE(app, argc, argv);

    if (!logLevel.empty())
        narrator::log::setLevel(narrator::log::levelFromString(logLevel));
    else if (verbose)
        narrator::log::setLevel(narrator::log::Level::Debug);

    // Load config
    auto configResult = configPath.empty() ? narrator::loadConfig() : narrator::loadConfigFromFile(configPath);

    if (!configResult)
    {
        narrator::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (auto const parsed = narrator::outputFormatFromString(format))
        config.exportSettings.format = *parsed;
    if (bitrate > 0)
        config.exportSettings.bitrate = bitrate;
    if (parallel > 0)
        config.generation.parallelism = parallel;
    if (!storeDir.empty())
        config.storage.directory = storeDir;

    auto application = narrator::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        narrator::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(options);
}
