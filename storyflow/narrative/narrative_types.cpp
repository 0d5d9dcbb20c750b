#include "narrative_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace storyflow::narrative {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::optional<double> parse_radix(std::string_view digits, int radix) {
    if (digits.empty()) return std::nullopt;

    double out = 0.0;
    for (char c : digits) {
        int d = -1;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = 10 + (c - 'a');
        else if (c >= 'A' && c <= 'F') d = 10 + (c - 'A');
        if (d < 0 || d >= radix) return std::nullopt;
        out = out * radix + d;
    }
    return out;
}

bool is_decimal_literal(std::string_view s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;

    std::size_t digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++digits; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++digits; }
    }
    if (digits == 0) return false;

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        std::size_t expDigits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++expDigits; }
        if (expDigits == 0) return false;
    }

    return i == s.size();
}

} // namespace

std::string_view trim_view(std::string_view s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// ============================================================================
// Coercion
// ============================================================================

std::optional<double> parse_number(std::string_view text) {
    std::string_view s = trim_view(text);
    if (s.empty()) return 0.0;

    if (s == "Infinity" || s == "+Infinity") return std::numeric_limits<double>::infinity();
    if (s == "-Infinity") return -std::numeric_limits<double>::infinity();

    if (s.size() > 2 && s[0] == '0') {
        const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(s[1])));
        if (p == 'x') return parse_radix(s.substr(2), 16);
        if (p == 'o') return parse_radix(s.substr(2), 8);
        if (p == 'b') return parse_radix(s.substr(2), 2);
    }

    if (!is_decimal_literal(s)) return std::nullopt;

    const std::string owned(s);
    return std::strtod(owned.c_str(), nullptr);
}

double to_number(const ConditionValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return *b ? 1.0 : 0.0;
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* s = std::get_if<std::string>(&value)) {
        auto parsed = parse_number(*s);
        return parsed ? *parsed : kNaN;
    }
    return kNaN;
}

bool loose_equals(const ConditionValue& a, const ConditionValue& b) {
    const bool aUndefined = std::holds_alternative<std::monostate>(a);
    const bool bUndefined = std::holds_alternative<std::monostate>(b);
    if (aUndefined || bUndefined) {
        return aUndefined && bUndefined;
    }

    if (std::holds_alternative<bool>(a) && std::holds_alternative<bool>(b)) {
        return std::get<bool>(a) == std::get<bool>(b);
    }

    if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
        return std::get<std::string>(a) == std::get<std::string>(b);
    }

    // Mixed types (or two numbers) meet on the number line. NaN never equals anything.
    return to_number(a) == to_number(b);
}

std::string format_number(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    if (value == 0.0) return "0";

    const double magnitude = std::fabs(value);

    // Shortest digits that read back to the same double.
    char buf[64];
    for (int precision = 0; precision <= 16; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision, magnitude);
        if (std::strtod(buf, nullptr) == magnitude) break;
    }

    const std::string scientific(buf);
    const auto e = scientific.find('e');
    std::string digits = scientific.substr(0, e);
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }

    // Decimal point sits after `point` digits.
    const int count = static_cast<int>(digits.size());
    const int point = std::atoi(scientific.c_str() + e + 1) + 1;

    std::string out = value < 0 ? "-" : "";
    if (count <= point && point <= 21) {
        out += digits;
        out.append(static_cast<std::size_t>(point - count), '0');
    } else if (0 < point && point <= 21) {
        out += digits.substr(0, static_cast<std::size_t>(point));
        out += '.';
        out += digits.substr(static_cast<std::size_t>(point));
    } else if (-6 < point && point <= 0) {
        out += "0.";
        out.append(static_cast<std::size_t>(-point), '0');
        out += digits;
    } else {
        out += digits.front();
        if (count > 1) {
            out += '.';
            out += digits.substr(1);
        }
        out += point > 0 ? "e+" : "e-";
        out += std::to_string(std::abs(point - 1));
    }
    return out;
}

std::string to_display_string(const ConditionValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (const auto* d = std::get_if<double>(&value)) return format_number(*d);
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    return "undefined";
}

ConditionValue condition_value_from_json(const Json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return std::monostate{};
    return value.dump();
}

// ============================================================================
// ActionPayload
// ============================================================================

ActionPayload::ActionPayload() : kind_(Kind::Scalar), value_(nullptr) {}

ActionPayload::ActionPayload(Json value) : value_(std::move(value)) {
    if (value_.is_object()) kind_ = Kind::Keyed;
    else if (value_.is_array()) kind_ = Kind::Sequence;
    else kind_ = Kind::Scalar;
}

ActionPayload ActionPayload::from_string(std::string value) {
    return ActionPayload(Json(std::move(value)));
}

std::string ActionPayload::as_string() const {
    if (value_.is_string()) return value_.get<std::string>();
    if (value_.is_boolean()) return value_.get<bool>() ? "true" : "false";
    if (value_.is_number()) return format_number(value_.get<double>());
    if (value_.is_null()) return "null";
    return value_.dump();
}

std::optional<double> ActionPayload::as_number() const {
    if (value_.is_number()) return value_.get<double>();
    if (value_.is_boolean()) return value_.get<bool>() ? 1.0 : 0.0;
    if (value_.is_string()) return parse_number(value_.get_ref<const std::string&>());
    return std::nullopt;
}

std::vector<ActionPayload> ActionPayload::elements() const {
    std::vector<ActionPayload> out;
    if (kind_ != Kind::Sequence) {
        out.push_back(*this);
        return out;
    }

    out.reserve(value_.size());
    for (const auto& item : value_) {
        out.emplace_back(item);
    }
    return out;
}

// ============================================================================
// ActionMap
// ============================================================================

ActionMap ActionMap::from_json(const Json& object) {
    ActionMap map;
    if (!object.is_object()) {
        return map;
    }

    for (auto it = object.begin(); it != object.end(); ++it) {
        map.set(it.key(), ActionPayload(it.value()));
    }
    return map;
}

Json ActionMap::to_json() const {
    Json out = Json::object();
    for (const auto& [key, payload] : entries_) {
        out[key] = payload.json();
    }
    return out;
}

void ActionMap::set(std::string key, ActionPayload payload) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(payload);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(payload));
}

void ActionMap::merge(const ActionMap& other) {
    for (const auto& [key, payload] : other.entries_) {
        set(key, payload);
    }
}

bool ActionMap::erase(std::string_view key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [key](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

const ActionPayload* ActionMap::find(std::string_view key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

std::vector<std::string> ActionMap::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

} // namespace storyflow::narrative
