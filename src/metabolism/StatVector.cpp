/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/StatVector.hpp"

#include <cmath>
#include <stdexcept>

namespace Lifeline {

double StatVector::clamp(double value, double min, double max) {
    if (std::isnan(value)) {
        return min;
    }
    if (value < min) {
        return min;
    }
    if (value > max) {
        return max;
    }
    return value;
}

void StatVector::define(const std::string& name, double value, double min, double max) {
    if (!std::isfinite(min) || !std::isfinite(max) || min > max) {
        throw std::invalid_argument("Stat '" + name + "' has invalid bounds [" +
                                    std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    m_stats[name] = StatValue{clamp(value, min, max), min, max};
}

double StatVector::get(const std::string& name, double fallback) const {
    auto it = m_stats.find(name);
    return it != m_stats.end() ? it->second.value : fallback;
}

const StatValue* StatVector::find(const std::string& name) const {
    auto it = m_stats.find(name);
    return it != m_stats.end() ? &it->second : nullptr;
}

bool StatVector::set(const std::string& name, double value) {
    auto it = m_stats.find(name);
    if (it == m_stats.end()) {
        throw std::out_of_range("Unknown stat '" + name + "'");
    }
    StatValue& stat = it->second;
    double clamped = clamp(value, stat.min, stat.max);
    if (clamped == stat.value) {
        return false;
    }
    stat.value = clamped;
    return true;
}

bool StatVector::adjust(const std::string& name, double delta) {
    auto it = m_stats.find(name);
    if (it == m_stats.end()) {
        throw std::out_of_range("Unknown stat '" + name + "'");
    }
    return set(name, it->second.value + delta);
}

void StatVector::setBounds(const std::string& name, double min, double max) {
    auto it = m_stats.find(name);
    if (it == m_stats.end()) {
        throw std::out_of_range("Unknown stat '" + name + "'");
    }
    define(name, it->second.value, min, max);
}

std::vector<std::string> StatVector::names() const {
    std::vector<std::string> result;
    result.reserve(m_stats.size());
    for (const auto& [name, stat] : m_stats) {
        result.push_back(name);
    }
    return result;
}

bool StatVector::operator==(const StatVector& other) const {
    if (m_stats.size() != other.m_stats.size()) {
        return false;
    }
    auto lhs = m_stats.begin();
    auto rhs = other.m_stats.begin();
    for (; lhs != m_stats.end(); ++lhs, ++rhs) {
        if (lhs->first != rhs->first || lhs->second.value != rhs->second.value ||
            lhs->second.min != rhs->second.min || lhs->second.max != rhs->second.max) {
            return false;
        }
    }
    return true;
}

} // namespace Lifeline
