/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STAT_VECTOR_HPP
#define STAT_VECTOR_HPP

#include <boost/container/flat_map.hpp>

#include <string>
#include <vector>

namespace Lifeline {

struct StatValue {
    double value{100.0};
    double min{0.0};
    double max{100.0};
};

/**
 * @brief Named, bounded stats of one player, ordered by name.
 *
 * Every stored value lies in [min, max]; set() and adjust() clamp.
 */
class StatVector {
public:
    using Storage = boost::container::flat_map<std::string, StatValue>;
    using const_iterator = Storage::const_iterator;

    /**
     * @brief Adds or redefines a stat; value is clamped into the range
     * @throws std::invalid_argument if min > max or a bound is not finite
     */
    void define(const std::string& name, double value, double min, double max);

    bool has(const std::string& name) const { return m_stats.find(name) != m_stats.end(); }
    double get(const std::string& name, double fallback = 0.0) const;
    const StatValue* find(const std::string& name) const;

    /**
     * @return true if the stored value changed
     * @throws std::out_of_range for an undefined stat
     */
    bool set(const std::string& name, double value);
    bool adjust(const std::string& name, double delta);

    // Changes bounds only, clamping the current value into them
    void setBounds(const std::string& name, double min, double max);

    std::vector<std::string> names() const;
    size_t size() const { return m_stats.size(); }
    bool empty() const { return m_stats.empty(); }

    const_iterator begin() const { return m_stats.begin(); }
    const_iterator end() const { return m_stats.end(); }

    bool operator==(const StatVector& other) const;

    static double clamp(double value, double min, double max);

private:
    Storage m_stats;
};

} // namespace Lifeline

#endif // STAT_VECTOR_HPP
