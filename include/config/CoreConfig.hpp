/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CORE_CONFIG_HPP
#define CORE_CONFIG_HPP

#include "config/ConfigMigration.hpp"
#include "utils/JsonReader.hpp"

#include <string>
#include <vector>

namespace Lifeline {

/**
 * @brief Process-wide settings stored in core.json.
 */
struct CoreConfig {
    static constexpr int CURRENT_VERSION = 2;
    static constexpr const char* DOCUMENT_NAME = "core";

    bool debug{false};
    std::vector<std::string> enabledModules{"metabolism"};
    int busyTimeoutMs{5000};
    int readerConnections{2};
    int ioThreads{2};
    int shutdownFlushTimeoutMs{5000};

    static CoreConfig fromJson(const JsonValue& document);
    JsonValue toJson() const;
    static bool validate(const JsonValue& document, std::string& error);
    static std::vector<ConfigMigration> migrations();

    bool isModuleEnabled(const std::string& moduleId) const;
};

} // namespace Lifeline

#endif // CORE_CONFIG_HPP
