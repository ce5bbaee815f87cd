#pragma once

#include <cmath>
#include <limits>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace rampart::agent::tools {

// Tool contract: Execute reports every expected failure as
// {"success": false, "error": ...} instead of throwing.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual nlohmann::json InputSchema() const = 0;
    virtual nlohmann::json Execute(const nlohmann::json& input) = 0;
    virtual bool NeedsApproval(const nlohmann::json& /*input*/) const { return false; }
};

inline nlohmann::json ErrorResult(const std::string& message,
                                  nlohmann::json extra = nlohmann::json::object()) {
    extra["success"] = false;
    extra["error"] = message;
    return extra;
}

inline std::string GetString(const nlohmann::json& input,
                             const std::string& key,
                             const std::string& fallback = {}) {
    if (!input.is_object() || !input.contains(key) || !input[key].is_string()) {
        return fallback;
    }
    return input[key].get<std::string>();
}

inline std::optional<long long> GetInteger(const nlohmann::json& input, const std::string& key) {
    if (!input.is_object() || !input.contains(key) || !input[key].is_number()) {
        return std::nullopt;
    }
    const auto& value = input[key];
    constexpr auto kMax = std::numeric_limits<long long>::max();
    constexpr auto kMin = std::numeric_limits<long long>::min();
    if (value.is_number_unsigned()) {
        const auto number = value.get<unsigned long long>();
        return number > static_cast<unsigned long long>(kMax) ? kMax : static_cast<long long>(number);
    }
    if (value.is_number_float()) {
        // Out-of-range doubles saturate; kMax as a double rounds up to 2^63.
        const auto number = value.get<double>();
        if (std::isnan(number)) {
            return std::nullopt;
        }
        if (number >= static_cast<double>(kMax)) {
            return kMax;
        }
        if (number <= static_cast<double>(kMin)) {
            return kMin;
        }
        return static_cast<long long>(number);
    }
    return value.get<long long>();
}

inline bool GetBool(const nlohmann::json& input, const std::string& key, bool fallback = false) {
    if (!input.is_object() || !input.contains(key) || !input[key].is_boolean()) {
        return fallback;
    }
    return input[key].get<bool>();
}

inline bool HasString(const nlohmann::json& input, const std::string& key) {
    return input.is_object() && input.contains(key) && input[key].is_string();
}

}  // namespace rampart::agent::tools
