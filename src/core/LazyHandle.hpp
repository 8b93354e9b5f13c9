// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <mutex>

namespace narrator
{

/// @brief Explicitly owned, lazily constructed instance shared by its callers.
///
/// The instance is created by the factory on first acquire(). A caller that observes the
/// instance in an invalid state (e.g. an aborted encoder) calls invalidate(); the next
/// acquire() then constructs a fresh one. Instances already handed out stay alive until
/// their last holder releases them.
template <typename T>
class LazyHandle
{
  public:
    using Factory = std::function<Result<std::shared_ptr<T>>()>;

    explicit LazyHandle(Factory factory): _factory(std::move(factory)) {}

    LazyHandle(const LazyHandle&) = delete;
    LazyHandle& operator=(const LazyHandle&) = delete;

    /// @brief Returns the current instance, constructing it if needed.
    [[nodiscard]] auto acquire() -> Result<std::shared_ptr<T>>
    {
        auto lock = std::lock_guard(_mutex);
        if (_instance)
            return _instance;

        auto created = _factory();
        if (!created)
            return std::unexpected(created.error());

        _instance = std::move(*created);
        ++_generation;
        return _instance;
    }

    /// @brief Discards the current instance if it is still the given one.
    void invalidate(const std::shared_ptr<T>& instance)
    {
        auto lock = std::lock_guard(_mutex);
        if (_instance == instance)
            _instance.reset();
    }

    /// @brief Discards the current instance unconditionally.
    void invalidate()
    {
        auto lock = std::lock_guard(_mutex);
        _instance.reset();
    }

    /// @brief Returns true if an instance is currently held.
    [[nodiscard]] auto isConstructed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _instance != nullptr;
    }

    /// @brief Returns how many instances the factory has produced so far.
    [[nodiscard]] auto generation() const -> unsigned
    {
        auto lock = std::lock_guard(_mutex);
        return _generation;
    }

  private:
    Factory _factory;
    mutable std::mutex _mutex;
    std::shared_ptr<T> _instance;
    unsigned _generation = 0;
};

} // namespace narrator
