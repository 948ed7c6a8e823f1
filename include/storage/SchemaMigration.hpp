/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCHEMA_MIGRATION_HPP
#define SCHEMA_MIGRATION_HPP

#include <functional>
#include <string>
#include <vector>

namespace Lifeline {

class Transaction;
class WorldStorage;

// One step of a module's table layout; version N brings the schema to N
struct SchemaStep {
    int version;
    std::string description;
    std::function<void(Transaction&)> apply;
};

/**
 * @brief Brings a module's tables up to the newest step.
 *
 * Steps must be numbered 1..N without gaps. Each pending step runs in its own
 * transaction together with the version bump, so a failure leaves the schema
 * at the last completed version.
 *
 * @return the module's schema version afterwards
 * @throws std::invalid_argument for a malformed step list, storage errors
 *         from the failing step otherwise
 */
int applySchemaSteps(WorldStorage& storage, const std::string& moduleId,
                     const std::vector<SchemaStep>& steps);

} // namespace Lifeline

#endif // SCHEMA_MIGRATION_HPP
