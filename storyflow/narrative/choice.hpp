#pragma once

#include "condition_evaluator.hpp"
#include "narrative_types.hpp"
#include "registries.hpp"

#include <functional>
#include <string>
#include <variant>

namespace storyflow::narrative {

// ============================================================================
// Choice - a presentable option gated by its own params
// ============================================================================
//
// Visibility reads the if/ifOr clauses, availability the active/activeOr
// clauses. Both are evaluated on every call so they always follow the
// current flags. A Choice must not outlive the engine that built it.

class Choice {
public:
    using DisplayNameFn = std::function<std::string(const Choice&)>;

    Choice() = default;
    Choice(std::string id, std::string name, ActionMap params, const ConditionEvaluator* evaluator);

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const ActionMap& params() const { return params_; }

    void set_name(std::string name) { name_ = std::move(name); }
    void set_params(ActionMap params) { params_ = std::move(params); }

    bool is_visible() const;
    bool is_available() const;

    /// Computed label; the raw name unless a choice modifier installed one.
    std::string display_name() const;
    void set_display_name(DisplayNameFn fn) { displayName_ = std::move(fn); }
    bool has_display_name() const { return static_cast<bool>(displayName_); }

private:
    bool gate(bool isActiveClause) const;

    std::string id_;
    std::string name_;
    ActionMap params_;
    DisplayNameFn displayName_;
    const ConditionEvaluator* evaluator_{nullptr};
};

// Input of create_custom_choice; params may still be near-JSON text.
struct ChoiceDefinition {
    std::string id;
    std::string name;
    std::variant<ActionMap, std::string> params;
};

// ============================================================================
// ChoiceBuilder
// ============================================================================

class ChoiceBuilder {
public:
    ChoiceBuilder(const Registries& registries, const ConditionEvaluator& evaluator);

    /// Text params that do not parse to an object are logged and the choice
    /// gets empty params (always visible and available).
    Choice create_custom_choice(const ChoiceDefinition& definition) const;

    /// Calls the choiceModifier of every registered action named in params,
    /// then defaults the display name to the raw name.
    void perform_choice_modifier(Choice& choice) const;

private:
    const Registries& registries_;
    const ConditionEvaluator& evaluator_;
};

} // namespace storyflow::narrative
