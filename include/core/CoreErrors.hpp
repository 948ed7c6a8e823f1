/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Lifeline {

/**
 * @brief Base of every error the core raises on purpose.
 *
 * Callers that only care about "something in Lifeline failed" catch this;
 * callers that can recover catch the concrete type.
 */
class LifelineError : public std::runtime_error {
public:
    explicit LifelineError(const std::string& message)
        : std::runtime_error("Lifeline - " + message) {}
};

/**
 * @brief A write could not acquire the world database within the busy timeout.
 *
 * Transient: callers retry with backoff.
 */
class StorageBusy : public LifelineError {
public:
    explicit StorageBusy(const std::string& message) : LifelineError(message) {}
};

/**
 * @brief The world database file is unreadable or not a database.
 *
 * Fatal for that world only; the world continues in memory.
 */
class StorageCorrupt : public LifelineError {
public:
    explicit StorageCorrupt(const std::string& message) : LifelineError(message) {}
};

/**
 * @brief An existing core table does not have the columns this build expects.
 */
class SchemaMismatch : public LifelineError {
public:
    explicit SchemaMismatch(const std::string& message) : LifelineError(message) {}
};

/**
 * @brief A config migration chain is incomplete or a transform failed.
 */
class ConfigMigrationFailed : public LifelineError {
public:
    explicit ConfigMigrationFailed(const std::string& message) : LifelineError(message) {}
};

/**
 * @brief A module could not complete a lifecycle phase.
 */
class ModuleLifecycleFailed : public LifelineError {
public:
    ModuleLifecycleFailed(const std::string& moduleId, const std::string& message)
        : LifelineError("module '" + moduleId + "': " + message), m_moduleId(moduleId) {}

    const std::string& getModuleId() const { return m_moduleId; }

private:
    std::string m_moduleId;
};

/**
 * @brief The host could not classify a player's activity this tick.
 *
 * Never fatal; the engine falls back to the idle multiplier.
 */
class ActivityClassificationUnavailable : public LifelineError {
public:
    explicit ActivityClassificationUnavailable(const std::string& message)
        : LifelineError(message) {}
};

} // namespace Lifeline

#endif // CORE_ERRORS_HPP
