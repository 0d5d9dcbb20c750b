#include "narrative_engine.hpp"
#include "builtins.hpp"

#include <raylib.h>

namespace storyflow::narrative {

NarrativeEngine::NarrativeEngine(INarrativeHost& host, core::NarrativeConfig config, bool registerBuiltins)
    : host_(host)
    , config_(std::move(config))
    , evaluator_(registries_, host_)
    , actions_(registries_)
    , choices_(registries_, evaluator_)
    , pipeline_(registries_, host_, evaluator_, actions_, config_)
{
    if (config_.max_resolve_depth < 1) {
        TraceLog(LOG_WARNING, "[narrative] max_resolve_depth %d is too small, using 1", config_.max_resolve_depth);
        config_.max_resolve_depth = 1;
    }

    if (registerBuiltins) {
        register_builtins(registries_, host_, triggers_);
    }
}

// ============================================================================
// Registration
// ============================================================================

void NarrativeEngine::register_condition(const std::string& name, ConditionFn fn) {
    registries_.conditions.register_condition(name, std::move(fn));
}

void NarrativeEngine::register_action(const std::string& name, ActionEntry entry) {
    registries_.actions.register_action(name, std::move(entry));
}

void NarrativeEngine::register_action(const std::string& name, ActionFn fn) {
    registries_.actions.register_action(name, std::move(fn));
}

void NarrativeEngine::register_placeholder(const std::string& name, PlaceholderFn fn) {
    registries_.placeholders.register_placeholder(name, std::move(fn));
}

// ============================================================================
// Resolution
// ============================================================================

ResolveResult NarrativeEngine::resolve_string(std::string_view text, bool noExecuteActions) {
    return pipeline_.resolve_string(text, noExecuteActions);
}

bool NarrativeEngine::perform_conditional_evaluation(const ActionMap* params, bool isActiveClause) const {
    return evaluator_.perform_conditional_evaluation(params, isActiveClause);
}

ConditionValue NarrativeEngine::get_condition_value(std::string_view key) const {
    return evaluator_.get_condition_value(key);
}

void NarrativeEngine::resolve_actions(const ActionMap& actions, bool skipDelayed) const {
    actions_.resolve_actions(actions, skipDelayed);
}

bool NarrativeEngine::resolve_actions(std::string_view text, bool skipDelayed) const {
    return actions_.resolve_actions(text, skipDelayed);
}

ActionMap NarrativeEngine::get_delayed_actions(const ActionMap& actions) const {
    return actions_.get_delayed_actions(actions);
}

ActionMap NarrativeEngine::get_reload_actions(const ActionMap& actions) const {
    return actions_.get_reload_actions(actions);
}

// ============================================================================
// Choices
// ============================================================================

Choice NarrativeEngine::create_custom_choice(const ChoiceDefinition& definition) const {
    return choices_.create_custom_choice(definition);
}

bool NarrativeEngine::perform_choice(const Choice& choice) {
    if (!choice.is_available()) {
        return false;
    }

    Json payload = Json::object();
    payload["id"] = choice.id();
    payload["name"] = choice.name();
    if (triggers_.dispatch(kTriggerChoice, payload) == TriggerResult::Stop) {
        TraceLog(LOG_DEBUG, "[narrative] Choice \"%s\" cancelled by a trigger", choice.id().c_str());
        return false;
    }

    if (!choice.id().empty()) {
        host_.record_visited_choice(choice.id());
    }

    actions_.resolve_actions(choice.params());

    if (!choice.name().empty()) {
        TraceLog(LOG_INFO, "[narrative] > %s", choice.display_name().c_str());
    }
    return true;
}

// ============================================================================
// Triggers
// ============================================================================

TriggerDispatcher::HandlerId NarrativeEngine::on(const std::string& trigger, TriggerCallback callback, int order) {
    return triggers_.on(trigger, std::move(callback), order);
}

bool NarrativeEngine::off(TriggerDispatcher::HandlerId id) {
    return triggers_.off(id);
}

TriggerResult NarrativeEngine::trigger(std::string_view name, const Json& payload) const {
    return triggers_.dispatch(name, payload);
}

} // namespace storyflow::narrative
