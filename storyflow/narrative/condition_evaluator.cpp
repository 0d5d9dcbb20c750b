#include "condition_evaluator.hpp"

#include <cctype>

#include <raylib.h>

namespace storyflow::narrative {

namespace {

bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ordering(CompareOp op) {
    return op == CompareOp::Greater || op == CompareOp::Less ||
           op == CompareOp::GreaterEqual || op == CompareOp::LessEqual;
}

} // namespace

const char* compare_op_to_string(CompareOp op) {
    switch (op) {
        case CompareOp::Equal: return "=";
        case CompareOp::NotEqual: return "!=";
        case CompareOp::Greater: return ">";
        case CompareOp::Less: return "<";
        case CompareOp::GreaterEqual: return ">=";
        case CompareOp::LessEqual: return "<=";
    }
    return "?";
}

ConditionEvaluator::ConditionEvaluator(const Registries& registries, const INarrativeHost& host)
    : registries_(registries), host_(host) {}

// ============================================================================
// Parsing
// ============================================================================

std::optional<SingleCondition> ConditionEvaluator::parse_condition(std::string_view condition) {
    std::size_t i = 0;

    // key: [A-Za-z0-9_.]+ with an optional "(...)" argument list
    while (i < condition.size() && is_key_char(condition[i])) ++i;
    if (i == 0) return std::nullopt;

    if (i < condition.size() && condition[i] == '(') {
        const auto close = condition.find(')', i);
        if (close == std::string_view::npos) return std::nullopt;
        i = close + 1;
    }

    SingleCondition out;
    out.key = std::string(condition.substr(0, i));

    while (i < condition.size() && std::isspace(static_cast<unsigned char>(condition[i]))) ++i;

    auto starts = [&](std::string_view tok) { return condition.substr(i, tok.size()) == tok; };

    if (starts("==")) { out.op = CompareOp::Equal; i += 2; }
    else if (starts("!=")) { out.op = CompareOp::NotEqual; i += 2; }
    else if (starts(">=")) { out.op = CompareOp::GreaterEqual; i += 2; }
    else if (starts("<=")) { out.op = CompareOp::LessEqual; i += 2; }
    else if (starts(">")) { out.op = CompareOp::Greater; i += 1; }
    else if (starts("<")) { out.op = CompareOp::Less; i += 1; }
    else if (starts("=")) { out.op = CompareOp::Equal; i += 1; }
    else return std::nullopt;

    if (i >= condition.size()) return std::nullopt;

    out.rawValue = std::string(trim_view(condition.substr(i)));
    return out;
}

std::vector<std::string> ConditionEvaluator::split_conditions(std::string_view clause) {
    std::vector<std::string> parts;
    std::string current;
    int parenDepth = 0;

    for (char c : clause) {
        if (c == '(') ++parenDepth;
        else if (c == ')') --parenDepth;

        if (c == ',' && parenDepth == 0) {
            parts.emplace_back(trim_view(current));
            current.clear();
        } else {
            current += c;
        }
    }

    const std::string_view tail = trim_view(current);
    if (!tail.empty()) parts.emplace_back(tail);
    return parts;
}

std::vector<std::string> ConditionEvaluator::split_args(std::string_view args) {
    std::vector<std::string> out;
    if (args.empty()) return out;

    std::size_t start = 0;
    while (true) {
        const auto comma = args.find(',', start);
        if (comma == std::string_view::npos) {
            out.emplace_back(trim_view(args.substr(start)));
            break;
        }
        out.emplace_back(trim_view(args.substr(start, comma - start)));
        start = comma + 1;
    }
    return out;
}

ConditionValue ConditionEvaluator::parse_comparison_value(std::string_view raw) {
    if (raw == "true") return true;
    if (raw == "false") return false;
    if (auto number = parse_number(raw)) return *number;
    return std::string(raw);
}

// ============================================================================
// Evaluation
// ============================================================================

ConditionValue ConditionEvaluator::get_condition_value(std::string_view key) const {
    if (key.empty() || key.front() != kConditionSigil) {
        return host_.get_flag(key);
    }

    // _name or _name(arg1, arg2)
    std::size_t i = 1;
    while (i < key.size() && is_name_char(key[i])) ++i;
    if (i == 1) {
        throw WiringError("Invalid condition format: " + std::string(key));
    }

    const std::string name(key.substr(0, i));
    std::vector<std::string> args;

    if (i < key.size()) {
        if (key[i] != '(' || key.back() != ')') {
            throw WiringError("Invalid condition format: " + std::string(key));
        }
        const std::string_view inner = key.substr(i + 1, key.size() - i - 2);
        if (inner.find(')') != std::string_view::npos) {
            throw WiringError("Invalid condition format: " + std::string(key));
        }
        args = split_args(inner);
    }

    const ConditionEntry* entry = registries_.conditions.find(name);
    if (!entry) {
        throw WiringError("Condition " + name + " not found");
    }

    const ConditionFn evaluate = entry->evaluate;
    return evaluate(args);
}

bool ConditionEvaluator::compare(const ConditionValue& actual, CompareOp op,
                                 const ConditionValue& expected, std::string_view condition) const {
    if (is_ordering(op) && std::holds_alternative<std::string>(expected)) {
        TraceLog(LOG_ERROR, "[narrative] Operator \"%s\" not supported for string comparison in condition \"%.*s\"",
                 compare_op_to_string(op), static_cast<int>(condition.size()), condition.data());
        return false;
    }

    switch (op) {
        case CompareOp::Equal: return loose_equals(actual, expected);
        case CompareOp::NotEqual: return !loose_equals(actual, expected);
        case CompareOp::Greater: return to_number(actual) > to_number(expected);
        case CompareOp::Less: return to_number(actual) < to_number(expected);
        case CompareOp::GreaterEqual: return to_number(actual) >= to_number(expected);
        case CompareOp::LessEqual: return to_number(actual) <= to_number(expected);
    }
    return false;
}

bool ConditionEvaluator::evaluate_single(std::string_view condition) const {
    auto parsed = parse_condition(condition);
    if (!parsed) {
        TraceLog(LOG_ERROR, "[narrative] Invalid condition format: \"%.*s\". Use format like key==value or key=value without quotes",
                 static_cast<int>(condition.size()), condition.data());
        return false;
    }

    const ConditionValue actual = get_condition_value(parsed->key);
    const ConditionValue expected = parse_comparison_value(parsed->rawValue);
    return compare(actual, parsed->op, expected, condition);
}

bool ConditionEvaluator::evaluate_all(std::string_view clause) const {
    for (const auto& condition : split_conditions(clause)) {
        if (!evaluate_single(condition)) {
            return false;
        }
    }
    return true;
}

bool ConditionEvaluator::evaluate_any(std::string_view clause) const {
    for (const auto& condition : split_conditions(clause)) {
        if (evaluate_single(condition)) {
            return true;
        }
    }
    return false;
}

bool ConditionEvaluator::perform_conditional_evaluation(const ActionMap* params, bool isActiveClause) const {
    if (!params) {
        return true;
    }

    const ActionPayload* primary = params->find(isActiveClause ? kClauseActive : kClauseIf);
    const ActionPayload* orClause = params->find(isActiveClause ? kClauseActiveOr : kClauseIfOr);

    // Only strings and booleans gate as a primary clause, only strings as an OR clause.
    const bool hasPrimary = primary && (primary->is_string() || primary->is_bool());
    const bool hasOr = orClause && orClause->is_string();

    if (!hasPrimary && !hasOr) {
        return true;
    }

    bool primaryPasses = true;
    if (hasPrimary) {
        primaryPasses = primary->is_bool()
            ? primary->json().get<bool>()
            : evaluate_all(primary->json().get_ref<const std::string&>());
    }

    bool orPasses = true;
    if (hasOr) {
        orPasses = evaluate_any(orClause->json().get_ref<const std::string&>());
    }

    return primaryPasses && orPasses;
}

} // namespace storyflow::narrative
