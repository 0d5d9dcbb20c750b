#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace storyflow::narrative {

// Insertion-ordered JSON; action maps must keep the order authors wrote.
using Json = nlohmann::ordered_json;

// ============================================================================
// Clause keys
// ============================================================================

inline constexpr std::string_view kClauseIf = "if";
inline constexpr std::string_view kClauseIfOr = "ifOr";
inline constexpr std::string_view kClauseActive = "active";
inline constexpr std::string_view kClauseActiveOr = "activeOr";

inline constexpr std::array<std::string_view, 4> kClauseKeys = {
    kClauseIf, kClauseIfOr, kClauseActive, kClauseActiveOr
};

inline bool is_clause_key(std::string_view key) {
    for (auto clause : kClauseKeys) {
        if (clause == key) return true;
    }
    return false;
}

// Key whose presence in an action object abandons the rest of the fragment.
inline constexpr std::string_view kRedirectKey = "redirect";

// ============================================================================
// Errors
// ============================================================================

// Invoking something that was never registered, where no safe default exists.
class WiringError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Registration rejected before insertion (e.g. condition name without sigil).
class RegistrationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// ============================================================================
// ConditionValue - what a condition or flag lookup yields
// ============================================================================

// monostate plays the role of "undefined".
using ConditionValue = std::variant<std::monostate, bool, double, std::string>;

// Whitespace-trimmed view of s.
std::string_view trim_view(std::string_view s);

// Loose equality with the coercion rules authors expect from `a = 1`:
// bools become numbers, numeric strings compare numerically against numbers,
// strings compare as strings, undefined only equals undefined.
bool loose_equals(const ConditionValue& a, const ConditionValue& b);

// Numeric coercion; NaN when the value has no numeric reading.
double to_number(const ConditionValue& value);

// Number("...") semantics: trimmed, empty -> 0, Infinity, 0x/0o/0b, exponents.
// nullopt where Number() would give NaN.
std::optional<double> parse_number(std::string_view text);

// Number-to-string the way authors see it ("3", "2.5", "-0.1", "1e-7",
// "NaN"): shortest round-trip digits, exponent only below 1e-6 or from 1e21.
std::string format_number(double value);

std::string to_display_string(const ConditionValue& value);

ConditionValue condition_value_from_json(const Json& value);

// ============================================================================
// TriggerResult - explicit stop signal for ordered callbacks
// ============================================================================

enum class TriggerResult : std::uint8_t {
    Continue = 0,
    Stop = 1,
};

// ============================================================================
// ActionPayload - {Scalar, Keyed, Sequence}, decided once at construction
// ============================================================================

class ActionPayload {
public:
    enum class Kind : std::uint8_t {
        Scalar = 0,   // string, number, bool or null
        Keyed,        // object
        Sequence,     // array: the action runs once per element
    };

    ActionPayload();
    explicit ActionPayload(Json value);

    static ActionPayload from_string(std::string value);

    bool is_keyed() const { return kind_ == Kind::Keyed; }

    bool is_string() const { return value_.is_string(); }
    bool is_bool() const { return value_.is_boolean(); }

    const Json& json() const { return value_; }

    // Scalars as text (strings verbatim), structured payloads as compact JSON.
    std::string as_string() const;
    std::optional<double> as_number() const;

    // Elements of a Sequence; a single-element list holding *this otherwise.
    std::vector<ActionPayload> elements() const;

    bool operator==(const ActionPayload& other) const { return value_ == other.value_; }
    bool operator!=(const ActionPayload& other) const { return !(*this == other); }

private:
    Kind kind_{Kind::Scalar};
    Json value_;
};

// ============================================================================
// ActionMap - ordered action name -> payload
// ============================================================================

class ActionMap {
public:
    using Entry = std::pair<std::string, ActionPayload>;
    using const_iterator = std::vector<Entry>::const_iterator;

    ActionMap() = default;

    // Top-level keys of a JSON object; anything else yields an empty map.
    static ActionMap from_json(const Json& object);
    Json to_json() const;

    // Overwrites in place: a repeated key keeps its first position.
    void set(std::string key, ActionPayload payload);
    void merge(const ActionMap& other);
    bool erase(std::string_view key);
    void clear() { entries_.clear(); }

    const ActionPayload* find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key) != nullptr; }

    std::vector<std::string> keys() const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const ActionMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const ActionMap& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

} // namespace storyflow::narrative
