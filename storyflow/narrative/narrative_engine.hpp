#pragma once

#include "action_resolver.hpp"
#include "choice.hpp"
#include "condition_evaluator.hpp"
#include "narrative_host.hpp"
#include "registries.hpp"
#include "text_pipeline.hpp"
#include "trigger_dispatcher.hpp"

#include <storyflow/core/config.hpp>

#include <string>
#include <string_view>

namespace storyflow::narrative {

// ============================================================================
// NarrativeEngine - registries plus everything that reads them
// ============================================================================
//
// One instance per running story. Owns the condition/action/placeholder
// registries and the trigger dispatcher; the host owns flags and content.
// Not copyable: collaborators hold references into the engine.

class NarrativeEngine {
public:
    explicit NarrativeEngine(INarrativeHost& host, core::NarrativeConfig config = {},
                             bool registerBuiltins = true);

    NarrativeEngine(const NarrativeEngine&) = delete;
    NarrativeEngine& operator=(const NarrativeEngine&) = delete;

    // --- Registration ---

    /// Throws RegistrationError when name lacks the '_' prefix.
    void register_condition(const std::string& name, ConditionFn fn);
    void register_action(const std::string& name, ActionEntry entry);
    void register_action(const std::string& name, ActionFn fn);
    void register_placeholder(const std::string& name, PlaceholderFn fn);

    Registries& registries() { return registries_; }
    const Registries& registries() const { return registries_; }

    // --- Text ---

    ResolveResult resolve_string(std::string_view text, bool noExecuteActions = false);

    // --- Conditions ---

    bool perform_conditional_evaluation(const ActionMap* params, bool isActiveClause = false) const;

    /// Throws WiringError for an unknown condition.
    ConditionValue get_condition_value(std::string_view key) const;

    // --- Actions ---

    void resolve_actions(const ActionMap& actions, bool skipDelayed = false) const;
    bool resolve_actions(std::string_view text, bool skipDelayed = false) const;
    ActionMap get_delayed_actions(const ActionMap& actions) const;
    ActionMap get_reload_actions(const ActionMap& actions) const;

    // --- Choices ---

    Choice create_custom_choice(const ChoiceDefinition& definition) const;

    /// Takes an available choice: raises the choice trigger (Stop cancels),
    /// records the visit and runs the choice's actions. Returns whether the
    /// choice was taken.
    bool perform_choice(const Choice& choice);

    // --- Triggers ---

    TriggerDispatcher::HandlerId on(const std::string& trigger, TriggerCallback callback, int order = 0);
    bool off(TriggerDispatcher::HandlerId id);
    TriggerResult trigger(std::string_view name, const Json& payload = Json()) const;

    INarrativeHost& host() { return host_; }
    const ConditionEvaluator& evaluator() const { return evaluator_; }
    const ActionResolver& action_resolver() const { return actions_; }
    TextPipeline& pipeline() { return pipeline_; }

private:
    INarrativeHost& host_;
    core::NarrativeConfig config_;

    Registries registries_;
    TriggerDispatcher triggers_;

    ConditionEvaluator evaluator_;
    ActionResolver actions_;
    ChoiceBuilder choices_;
    TextPipeline pipeline_;
};

} // namespace storyflow::narrative
