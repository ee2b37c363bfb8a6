#include "lumen/structure/Parameter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace lumen::structure {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

Parameter::Parameter(std::string key, bool defaultValue, ParameterTier tier)
: key_(std::move(key)), tier_(tier), value_(defaultValue), default_(defaultValue) {}

Parameter::Parameter(std::string key, int defaultValue, int minimum, int maximum, ParameterTier tier)
: key_(std::move(key)), tier_(tier), value_(defaultValue), default_(defaultValue)
, min_(minimum), max_(maximum) {}

Parameter::Parameter(std::string key, double defaultValue, double minimum, double maximum, ParameterTier tier)
: key_(std::move(key)), tier_(tier), value_(defaultValue), default_(defaultValue)
, min_(minimum), max_(maximum) {}

Parameter::Parameter(std::string key, std::string defaultValue, ParameterTier tier)
: key_(std::move(key)), tier_(tier), value_(defaultValue), default_(std::move(defaultValue)) {}

Parameter::Parameter(std::string key, std::string defaultValue, std::vector<std::string> options, ParameterTier tier)
: key_(std::move(key)), tier_(tier), value_(defaultValue), default_(std::move(defaultValue))
, options_(std::move(options)) {}

expected<bool> Parameter::assign(Value value) {
    Value coerced;

    if (std::holds_alternative<bool>(value_)) {
        if (!std::holds_alternative<bool>(value)) {
            return unexpected(errc::invalid_parameter);
        }
        coerced = value;
    } else if (std::holds_alternative<int>(value_)) {
        int v = 0;
        if (auto i = std::get_if<int>(&value)) {
            v = *i;
        } else if (auto d = std::get_if<double>(&value)) {
            // Whole numbers arrive as doubles from some JSON writers.
            if (!std::isfinite(*d) || std::floor(*d) != *d) {
                return unexpected(errc::invalid_parameter);
            }
            v = static_cast<int>(std::clamp(*d, min_, max_));
        } else {
            return unexpected(errc::invalid_parameter);
        }
        coerced = std::clamp(v, static_cast<int>(min_), static_cast<int>(max_));
    } else if (std::holds_alternative<double>(value_)) {
        double v = 0.0;
        if (auto d = std::get_if<double>(&value)) {
            v = *d;
        } else if (auto i = std::get_if<int>(&value)) {
            v = static_cast<double>(*i);
        } else {
            return unexpected(errc::invalid_parameter);
        }
        if (!std::isfinite(v)) {
            return unexpected(errc::invalid_parameter);
        }
        coerced = std::clamp(v, min_, max_);
    } else {
        auto s = std::get_if<std::string>(&value);
        if (!s) {
            return unexpected(errc::invalid_parameter);
        }
        if (options_.empty()) {
            coerced = *s;
        } else {
            auto key = lowercase(*s);
            if (std::find(options_.begin(), options_.end(), key) == options_.end()) {
                return unexpected(errc::invalid_parameter);
            }
            coerced = std::move(key);
        }
    }

    if (coerced == value_) {
        return false;
    }
    value_ = std::move(coerced);
    return true;
}

} // namespace lumen::structure
