/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "config/CoreConfig.hpp"

#include <algorithm>

namespace Lifeline {

CoreConfig CoreConfig::fromJson(const JsonValue& document) {
    CoreConfig config;
    config.debug = document.getBool("debug", config.debug);

    if (const JsonArray* modules = document["enabledModules"].tryAsArray()) {
        config.enabledModules.clear();
        for (const auto& module : *modules) {
            if (auto id = module.tryAsString()) {
                config.enabledModules.push_back(*id);
            }
        }
    }

    const JsonValue& storage = document["storage"];
    config.busyTimeoutMs = storage.getInt("busyTimeoutMs", config.busyTimeoutMs);
    config.readerConnections = storage.getInt("readerConnections", config.readerConnections);
    config.ioThreads = document.getInt("ioThreads", config.ioThreads);
    config.shutdownFlushTimeoutMs =
        document.getInt("shutdownFlushTimeoutMs", config.shutdownFlushTimeoutMs);
    return config;
}

JsonValue CoreConfig::toJson() const {
    JsonValue document = JsonValue::object();
    document["debug"] = JsonValue(debug);

    JsonValue modules = JsonValue::array();
    for (const auto& id : enabledModules) {
        modules.push(JsonValue(id));
    }
    document["enabledModules"] = std::move(modules);

    document["storage"]["busyTimeoutMs"] = JsonValue(busyTimeoutMs);
    document["storage"]["readerConnections"] = JsonValue(readerConnections);
    document["ioThreads"] = JsonValue(ioThreads);
    document["shutdownFlushTimeoutMs"] = JsonValue(shutdownFlushTimeoutMs);
    return document;
}

bool CoreConfig::validate(const JsonValue& document, std::string& error) {
    if (document.hasKey("enabledModules")) {
        const JsonArray* modules = document["enabledModules"].tryAsArray();
        if (modules == nullptr) {
            error = "enabledModules must be an array";
            return false;
        }
        for (const auto& module : *modules) {
            if (!module.isString() || module.asString().empty()) {
                error = "enabledModules entries must be non-empty strings";
                return false;
            }
        }
    }

    CoreConfig config = fromJson(document);
    if (config.busyTimeoutMs <= 0) {
        error = "storage.busyTimeoutMs must be positive";
        return false;
    }
    if (config.readerConnections < 1 || config.readerConnections > 16) {
        error = "storage.readerConnections must be between 1 and 16";
        return false;
    }
    if (config.ioThreads < 1 || config.ioThreads > 64) {
        error = "ioThreads must be between 1 and 64";
        return false;
    }
    if (config.shutdownFlushTimeoutMs < 0) {
        error = "shutdownFlushTimeoutMs must not be negative";
        return false;
    }
    return true;
}

std::vector<ConfigMigration> CoreConfig::migrations() {
    return {
        {1, 2, "move busyTimeoutMs into the storage section",
         [](JsonValue document) {
             if (document.hasKey("busyTimeoutMs")) {
                 document["storage"]["busyTimeoutMs"] = document["busyTimeoutMs"];
                 document.erase("busyTimeoutMs");
             }
             return document;
         }},
    };
}

bool CoreConfig::isModuleEnabled(const std::string& moduleId) const {
    return std::find(enabledModules.begin(), enabledModules.end(), moduleId) !=
           enabledModules.end();
}

} // namespace Lifeline
