#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace Qalla {

    // Returns "" for non-string input; otherwise trims surrounding whitespace
    // and truncates to maxLen code points.
    std::string ClampString(const nlohmann::json& value, size_t maxLen);
    std::string ClampString(const std::string& value, size_t maxLen);

    // ClampString with an empty result replaced by fallback.
    std::string ClampOr(const nlohmann::json& value, size_t maxLen, const std::string& fallback);

    // "#RRGGBB" (case-insensitive) passes through trimmed, anything else maps
    // to kDefaultColor.
    std::string NormalizeColor(const nlohmann::json& value);

    // JSON truthiness: absent, null, false, 0 and "" are not present.
    bool IsPresent(const nlohmann::json& value);

    // Member lookup that tolerates non-object bodies and missing keys.
    const nlohmann::json& FieldOrNull(const nlohmann::json& body, const char* key);

} // namespace Qalla
