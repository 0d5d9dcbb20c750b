#pragma once

#include "narrative_host.hpp"
#include "narrative_types.hpp"
#include "registries.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow::narrative {

enum class CompareOp : std::uint8_t {
    Equal = 0,      // "=" or "=="
    NotEqual,       // "!="
    Greater,        // ">"
    Less,           // "<"
    GreaterEqual,   // ">="
    LessEqual,      // "<="
};

const char* compare_op_to_string(CompareOp op);

// One "key op value" term, e.g. "gold>=10" or "_item_on(alice, sword) = true".
struct SingleCondition {
    std::string key;
    CompareOp op{CompareOp::Equal};
    std::string rawValue;   // trimmed right-hand side
};

// ============================================================================
// ConditionEvaluator
// ============================================================================

class ConditionEvaluator {
public:
    ConditionEvaluator(const Registries& registries, const INarrativeHost& host);

    /// Gate over a parameter map. The primary clause is "if" ("active" when
    /// isActiveClause), the OR clause "ifOr" ("activeOr"). No params or no
    /// clause means no gate (true).
    /// Throws WiringError when a clause references an unregistered condition.
    bool perform_conditional_evaluation(const ActionMap* params, bool isActiveClause = false) const;
    bool perform_conditional_evaluation(const ActionMap& params, bool isActiveClause = false) const {
        return perform_conditional_evaluation(&params, isActiveClause);
    }

    /// AND over a comma list of single conditions.
    bool evaluate_all(std::string_view clause) const;

    /// OR over a comma list of single conditions.
    bool evaluate_any(std::string_view clause) const;

    /// Malformed conditions and string operands of ordering operators are
    /// logged and evaluate false.
    bool evaluate_single(std::string_view condition) const;

    /// "_name" / "_name(a, b)" calls the registered condition, anything else
    /// reads the host flag storage. Throws WiringError for an unknown or
    /// malformed condition reference.
    ConditionValue get_condition_value(std::string_view key) const;

    static std::optional<SingleCondition> parse_condition(std::string_view condition);

    // Comma split that ignores commas inside parentheses; parts are trimmed.
    static std::vector<std::string> split_conditions(std::string_view clause);

    // Plain comma split of condition / placeholder arguments, parts trimmed.
    static std::vector<std::string> split_args(std::string_view args);

    // "true"/"false" -> bool, Number()-parsable -> number, else the raw string.
    static ConditionValue parse_comparison_value(std::string_view raw);

private:
    bool compare(const ConditionValue& actual, CompareOp op, const ConditionValue& expected,
                 std::string_view condition) const;

    const Registries& registries_;
    const INarrativeHost& host_;
};

} // namespace storyflow::narrative
