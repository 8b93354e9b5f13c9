// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <synthesis/SynthesisBackend.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace narrator
{

/// @brief Voice synthesis configuration section.
struct SynthesisConfig
{
    /// @brief Path to the piper voice model (.onnx file).
    std::string modelPath;

    /// @brief Path to the espeak-ng-data directory (optional, defaults to built-in).
    std::string espeakDataPath;

    std::optional<int> speakerId;
    std::optional<float> lengthScale;
    std::optional<float> noiseScale;
    std::optional<float> noiseWScale;
};

/// @brief Segment generation configuration section.
struct GenerationConfig
{
    /// @brief Concurrent synthesis calls per chapter (at least 1).
    int parallelism = 1;

    /// @brief Segments buffered before an intermediate store flush (at least 1).
    int persistBatchSize = 10;
};

/// @brief Whole-book export configuration section.
struct ExportConfig
{
    OutputFormat format = OutputFormat::Wav;
    unsigned bitrate = 192;

    /// @brief Executable used for compressed and chaptered formats.
    std::string transcoderPath = "ffmpeg";
};

/// @brief Storage configuration section.
struct StorageConfig
{
    /// @brief Root of the segment store; empty means `<data dir>/library`.
    std::string directory;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    SynthesisConfig synthesis;
    GenerationConfig generation;
    ExportConfig exportSettings;
    StorageConfig storage;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/narrator or ~/.local/share/narrator
/// On macOS: ~/Library/Application Support/narrator
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the store directory configured, or the default one.
[[nodiscard]] auto storageDirectory(const AppConfig& config) -> std::string;

/// @brief Returns the voice parameters configured in the synthesis section.
[[nodiscard]] auto voiceParams(const SynthesisConfig& config) -> VoiceParams;

} // namespace narrator
