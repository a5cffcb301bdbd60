#include "Sanitizer.h"
#include "Protocol.h"
#include <cctype>

namespace Qalla {

    namespace {

        bool IsSpace(unsigned char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        bool IsContinuationByte(unsigned char c) {
            return (c & 0xC0u) == 0x80u;
        }

    } // namespace

    std::string ClampString(const std::string& value, size_t maxLen) {
        size_t begin = 0;
        size_t end = value.size();
        while (begin < end && IsSpace(static_cast<unsigned char>(value[begin]))) ++begin;
        while (end > begin && IsSpace(static_cast<unsigned char>(value[end - 1]))) --end;

        // Count code points so a multi-byte character is never split.
        size_t codePoints = 0;
        size_t cut = begin;
        while (cut < end) {
            if (!IsContinuationByte(static_cast<unsigned char>(value[cut]))) {
                if (codePoints == maxLen) break;
                ++codePoints;
            }
            ++cut;
        }
        return value.substr(begin, cut - begin);
    }

    std::string ClampString(const nlohmann::json& value, size_t maxLen) {
        if (!value.is_string()) return {};
        return ClampString(value.get_ref<const std::string&>(), maxLen);
    }

    std::string ClampOr(const nlohmann::json& value, size_t maxLen, const std::string& fallback) {
        std::string out = ClampString(value, maxLen);
        return out.empty() ? fallback : out;
    }

    std::string NormalizeColor(const nlohmann::json& value) {
        if (!value.is_string()) return kDefaultColor;
        const std::string& raw = value.get_ref<const std::string&>();
        std::string v = ClampString(raw, raw.size());
        if (v.size() != 7 || v[0] != '#') return kDefaultColor;
        for (size_t i = 1; i < v.size(); ++i)
            if (!std::isxdigit(static_cast<unsigned char>(v[i]))) return kDefaultColor;
        return v;
    }

    bool IsPresent(const nlohmann::json& value) {
        switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return value.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;
        }
    }

    const nlohmann::json& FieldOrNull(const nlohmann::json& body, const char* key) {
        static const nlohmann::json kNull;
        if (!body.is_object()) return kNull;
        auto it = body.find(key);
        return it == body.end() ? kNull : *it;
    }

} // namespace Qalla
