/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STATUS_LINE_HPP
#define STATUS_LINE_HPP

/**
 * @file StatusLine.hpp
 * @brief Composes the human-readable stat summary pushed to the EffectSink
 *
 * A StatusLineComposer holds an explicitly ordered list of sections; each
 * section appends its part of the line. The default composition is
 *
 *   hunger 74.0 | thirst 98.8 [Peckish]
 *
 * i.e. stat values first, then one bracketed label per active band.
 */

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace Lifeline {

class EffectBandSet;
class StatVector;
struct MetabolismConfig;

struct StatusView {
    const StatVector& stats;
    const EffectBandSet& effects;
    const MetabolismConfig& config;
};

class StatusSection {
public:
    virtual ~StatusSection() = default;

    virtual void build(std::ostringstream& cursor, const StatusView& view) const = 0;
};

// Configured and enabled stats, one decimal, separated by " | "
class StatValuesSection : public StatusSection {
public:
    void build(std::ostringstream& cursor, const StatusView& view) const override;
};

// " [Label]" for the most severe active effect of every band
class EffectLabelsSection : public StatusSection {
public:
    void build(std::ostringstream& cursor, const StatusView& view) const override;
};

class StatusLineComposer {
public:
    StatusLineComposer() = default;
    explicit StatusLineComposer(std::vector<std::shared_ptr<const StatusSection>> sections)
        : m_sections(std::move(sections)) {}

    // Stat values followed by effect labels
    static StatusLineComposer makeDefault();

    std::string compose(const StatusView& view) const;
    size_t size() const { return m_sections.size(); }

private:
    std::vector<std::shared_ptr<const StatusSection>> m_sections;
};

} // namespace Lifeline

#endif // STATUS_LINE_HPP
