// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace narrator
{

namespace
{

    auto optionalInt(const nlohmann::json& obj, std::string_view key) -> std::optional<int>
    {
        auto const keyStr = std::string(key);
        if (obj.contains(keyStr) && obj[keyStr].is_number_integer())
            return obj[keyStr].get<int>();
        return std::nullopt;
    }

    auto optionalFloat(const nlohmann::json& obj, std::string_view key) -> std::optional<float>
    {
        auto const keyStr = std::string(key);
        if (obj.contains(keyStr) && obj[keyStr].is_number())
            return obj[keyStr].get<float>();
        return std::nullopt;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/narrator";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/narrator";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/narrator";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/narrator";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && *xdgData)
        return std::string(xdgData) + "/narrator";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/narrator";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto storageDirectory(const AppConfig& config) -> std::string
{
    if (!config.storage.directory.empty())
        return config.storage.directory;
    return defaultDataDir() + "/library";
}

auto voiceParams(const SynthesisConfig& config) -> VoiceParams
{
    return VoiceParams {
        .speakerId = config.speakerId,
        .lengthScale = config.lengthScale,
        .noiseScale = config.noiseScale,
        .noiseWScale = config.noiseWScale,
    };
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content, ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = AppConfig {};

    // Synthesis section
    if (root.contains("synthesis"))
    {
        auto const& synthesis = root["synthesis"];
        config.synthesis.modelPath = json::getStringOr(synthesis, "modelPath", "");
        config.synthesis.espeakDataPath = json::getStringOr(synthesis, "espeakDataPath", "");
        config.synthesis.speakerId = optionalInt(synthesis, "speakerId");
        config.synthesis.lengthScale = optionalFloat(synthesis, "lengthScale");
        config.synthesis.noiseScale = optionalFloat(synthesis, "noiseScale");
        config.synthesis.noiseWScale = optionalFloat(synthesis, "noiseWScale");
    }

    // Generation section
    if (root.contains("generation"))
    {
        auto const& generation = root["generation"];
        config.generation.parallelism = std::max(1, json::getIntOr(generation, "parallelism", 1));
        config.generation.persistBatchSize = std::max(1, json::getIntOr(generation, "persistBatchSize", 10));
    }

    // Export section
    if (root.contains("export"))
    {
        auto const& exportSection = root["export"];
        auto const formatName = json::getStringOr(exportSection, "format", "wav");
        if (auto const format = outputFormatFromString(formatName))
            config.exportSettings.format = *format;
        else
            log::warning("Unknown export format '{}' in {}, using wav", formatName, path);
        config.exportSettings.bitrate = static_cast<unsigned>(std::max(8, json::getIntOr(exportSection, "bitrate", 192)));
        config.exportSettings.transcoderPath = json::getStringOr(exportSection, "transcoderPath", "ffmpeg");
    }

    // Storage section
    if (root.contains("storage"))
        config.storage.directory = json::getStringOr(root["storage"], "directory", "");

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Synthesis section
    auto synthesis = nlohmann::json::object();
    if (!config.synthesis.modelPath.empty())
        synthesis["modelPath"] = config.synthesis.modelPath;
    if (!config.synthesis.espeakDataPath.empty())
        synthesis["espeakDataPath"] = config.synthesis.espeakDataPath;
    if (config.synthesis.speakerId)
        synthesis["speakerId"] = *config.synthesis.speakerId;
    if (config.synthesis.lengthScale)
        synthesis["lengthScale"] = *config.synthesis.lengthScale;
    if (config.synthesis.noiseScale)
        synthesis["noiseScale"] = *config.synthesis.noiseScale;
    if (config.synthesis.noiseWScale)
        synthesis["noiseWScale"] = *config.synthesis.noiseWScale;
    root["synthesis"] = std::move(synthesis);

    // Generation section
    auto generation = nlohmann::json::object();
    generation["parallelism"] = config.generation.parallelism;
    generation["persistBatchSize"] = config.generation.persistBatchSize;
    root["generation"] = std::move(generation);

    // Export section
    auto exportSection = nlohmann::json::object();
    exportSection["format"] = outputFormatName(config.exportSettings.format);
    exportSection["bitrate"] = config.exportSettings.bitrate;
    exportSection["transcoderPath"] = config.exportSettings.transcoderPath;
    root["export"] = std::move(exportSection);

    // Storage section
    if (!config.storage.directory.empty())
        root["storage"] = nlohmann::json { { "directory", config.storage.directory } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace narrator
