#include "choice.hpp"
#include "tolerant_json.hpp"

#include <raylib.h>

namespace storyflow::narrative {

Choice::Choice(std::string id, std::string name, ActionMap params, const ConditionEvaluator* evaluator)
    : id_(std::move(id))
    , name_(std::move(name))
    , params_(std::move(params))
    , evaluator_(evaluator) {}

bool Choice::gate(bool isActiveClause) const {
    if (!evaluator_) {
        return true;
    }

    try {
        return evaluator_->perform_conditional_evaluation(params_, isActiveClause);
    } catch (const WiringError& e) {
        TraceLog(LOG_ERROR, "[narrative] Choice \"%s\" %s check failed: %s",
                 id_.c_str(), isActiveClause ? "availability" : "visibility", e.what());
        return false;
    }
}

bool Choice::is_visible() const {
    return gate(false);
}

bool Choice::is_available() const {
    return gate(true);
}

std::string Choice::display_name() const {
    if (displayName_) {
        return displayName_(*this);
    }
    return name_;
}

// ============================================================================
// ChoiceBuilder
// ============================================================================

ChoiceBuilder::ChoiceBuilder(const Registries& registries, const ConditionEvaluator& evaluator)
    : registries_(registries), evaluator_(evaluator) {}

Choice ChoiceBuilder::create_custom_choice(const ChoiceDefinition& definition) const {
    ActionMap params;

    if (const auto* structured = std::get_if<ActionMap>(&definition.params)) {
        params = *structured;
    } else {
        const auto& text = std::get<std::string>(definition.params);
        if (!trim_view(text).empty()) {
            auto parsed = TolerantJson::parse(text);
            if (parsed && parsed.value.is_object()) {
                params = ActionMap::from_json(parsed.value);
            } else {
                TraceLog(LOG_ERROR, "[narrative] Choice \"%s\" has unreadable params \"%s\": %s",
                         definition.id.c_str(), text.c_str(),
                         parsed ? "not an object" : parsed.error.c_str());
            }
        }
    }

    Choice choice(definition.id, definition.name, std::move(params), &evaluator_);
    perform_choice_modifier(choice);
    return choice;
}

void ChoiceBuilder::perform_choice_modifier(Choice& choice) const {
    // Modifiers may rewrite params; iterate a snapshot.
    const ActionMap params = choice.params();

    for (const auto& [name, payload] : params) {
        const ActionEntry* entry = registries_.actions.find(name);
        if (entry && entry->choiceModifier) {
            const ChoiceModifierFn modifier = entry->choiceModifier;
            modifier(choice, payload);
        }
    }

    if (!choice.has_display_name()) {
        choice.set_display_name([](const Choice& c) { return c.name(); });
    }
}

} // namespace storyflow::narrative
