/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "storage/SchemaMigration.hpp"
#include "core/Logger.hpp"
#include "storage/WorldStorage.hpp"

#include <stdexcept>

namespace Lifeline {

int applySchemaSteps(WorldStorage& storage, const std::string& moduleId,
                     const std::vector<SchemaStep>& steps) {
    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].version != static_cast<int>(i + 1) || !steps[i].apply) {
            throw std::invalid_argument("Schema steps for module '" + moduleId +
                                        "' must be numbered 1.." +
                                        std::to_string(steps.size()) +
                                        " without gaps, found " +
                                        std::to_string(steps[i].version) +
                                        " at position " + std::to_string(i + 1));
        }
    }

    int current = storage.getModuleSchemaVersion(moduleId);
    if (current > static_cast<int>(steps.size())) {
        STORAGE_WARN("World '" + storage.getWorldId() + "' has schema v" +
                     std::to_string(current) + " for module '" + moduleId +
                     "', newer than this build knows (v" +
                     std::to_string(steps.size()) + ")");
        return current;
    }

    for (const auto& step : steps) {
        if (step.version <= current) {
            continue;
        }
        storage.transaction([&](Transaction& tx) {
            step.apply(tx);
            tx.setModuleSchemaVersion(moduleId, step.version);
        });
        STORAGE_INFO("World '" + storage.getWorldId() + "' module '" + moduleId +
                     "' schema v" + std::to_string(current) + " -> v" +
                     std::to_string(step.version) + ": " + step.description);
        current = step.version;
    }
    return current;
}

} // namespace Lifeline
