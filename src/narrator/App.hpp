// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <narrator/Config.hpp>

#include <memory>
#include <string>

namespace narrator
{

/// @brief What a single command line invocation should do.
struct RunOptions
{
    /// @brief Book manifest to generate.
    std::string bookPath;

    /// @brief Destination of the exported book; defaults to `<book id>.<format>`.
    std::string outputPath;

    /// @brief Skip generation and export chapter audio already in the store.
    bool exportOnly = false;

    /// @brief When set, per-chapter audio and EPUB3 media overlays are written here as well.
    std::string overlayDirectory;
};

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Prepares the store, the decode backend and the lazily created voice and transcoder.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Generates and exports one book.
    /// @return Exit code (0 for success, 130 when interrupted).
    [[nodiscard]] auto run(const RunOptions& options) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
