/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/StatusLine.hpp"
#include "metabolism/EffectBandSet.hpp"
#include "metabolism/MetabolismConfig.hpp"
#include "metabolism/StatVector.hpp"

#include <iomanip>

namespace Lifeline {

void StatValuesSection::build(std::ostringstream& cursor, const StatusView& view) const {
    cursor << std::fixed << std::setprecision(1);
    bool first = true;
    for (const auto& [name, stat] : view.stats) {
        auto configured = view.config.stats.find(name);
        if (configured == view.config.stats.end() || !configured->second.enabled) {
            continue;
        }
        cursor << (first ? "" : " | ") << name << ' ' << stat.value;
        first = false;
    }
}

void EffectLabelsSection::build(std::ostringstream& cursor, const StatusView& view) const {
    for (const auto& label : view.effects.getLabels()) {
        cursor << " [" << label << ']';
    }
}

StatusLineComposer StatusLineComposer::makeDefault() {
    return StatusLineComposer({std::make_shared<StatValuesSection>(),
                               std::make_shared<EffectLabelsSection>()});
}

std::string StatusLineComposer::compose(const StatusView& view) const {
    std::ostringstream cursor;
    for (const auto& section : m_sections) {
        section->build(cursor, view);
    }
    return cursor.str();
}

} // namespace Lifeline
