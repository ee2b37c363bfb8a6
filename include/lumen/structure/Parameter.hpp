#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "lumen/core/Expected.hpp"

namespace lumen::structure {

class FixtureNode;
class Structure;

/// What a fixture has to recompute when a parameter changes.
enum class ParameterTier {
    Output = 0, // output state only (enabled, brightness, mute, ...)
    Metrics,    // point count or layout: full regenerate
    Geometry,   // positions only: indices are kept
    Datagram    // packet addressing: packet specs are rebuilt
};

/**
 * @brief Typed, bounded fixture setting.
 *
 * The value type is fixed at construction. Numeric parameters clamp to their
 * range; string parameters may be restricted to a list of options (matched
 * case-insensitively, stored lowercase). Values only change through
 * FixtureNode::set() / setParameter() so the owning fixture can propagate the
 * change according to the parameter's tier.
 */
class Parameter {
public:
    using Value = std::variant<bool, int, double, std::string>;

    Parameter(std::string key, bool defaultValue, ParameterTier tier = ParameterTier::Output);
    Parameter(std::string key, int defaultValue, int minimum, int maximum, ParameterTier tier);
    Parameter(std::string key, double defaultValue, double minimum, double maximum, ParameterTier tier);
    Parameter(std::string key, std::string defaultValue, ParameterTier tier);
    Parameter(std::string key, std::string defaultValue, std::vector<std::string> options, ParameterTier tier);

    Parameter(const Parameter&) = delete;
    Parameter& operator=(const Parameter&) = delete;

    const std::string& key() const { return key_; }
    ParameterTier tier() const { return tier_; }
    const Value& value() const { return value_; }
    const Value& defaultValue() const { return default_; }
    const std::vector<std::string>& options() const { return options_; }

    bool getBool() const { return std::get<bool>(value_); }
    int getInt() const { return std::get<int>(value_); }
    double getDouble() const { return std::get<double>(value_); }
    float getFloat() const { return static_cast<float>(std::get<double>(value_)); }
    const std::string& getString() const { return std::get<std::string>(value_); }

    double minimum() const { return min_; }
    double maximum() const { return max_; }

private:
    friend class FixtureNode;
    friend class Structure;

    /// Coerces, validates and stores @p value. Returns whether the stored value changed.
    expected<bool> assign(Value value);

    std::string key_;
    ParameterTier tier_;
    Value value_;
    Value default_;
    double min_ = 0.0;
    double max_ = 0.0;
    std::vector<std::string> options_;
};

} // namespace lumen::structure
