#pragma once

#include "action_resolver.hpp"
#include "condition_evaluator.hpp"
#include "conditional_parser.hpp"
#include "narrative_host.hpp"
#include "registries.hpp"

#include <storyflow/core/config.hpp>

#include <string>
#include <string_view>

namespace storyflow::narrative {

struct ResolveResult {
    std::string output;
    ActionMap actions;

    // Set when an action object carried the redirect key.
    bool redirected{false};
};

// ============================================================================
// TextPipeline - one fragment of authored text -> renderable output + actions
// ============================================================================
//
// Passes, in order:
//   [code]...[/code]    escaped, later passes do not see its contents
//   |name(args)|        placeholders
//   if{}/else{}/fi{}    conditional branches
//   |$id|, |$box.id|    templates, resolved recursively
//   {...}               action objects
//   Speaker: text       talking character
//   **x**, *x*          <i>, <b>

class TextPipeline {
public:
    TextPipeline(const Registries& registries, INarrativeHost& host,
                 const ConditionEvaluator& evaluator, const ActionResolver& actions,
                 const core::NarrativeConfig& config);

    /// Never throws on authoring errors. Past max_resolve_depth nested calls
    /// the text comes back unresolved with no actions.
    ResolveResult resolve_string(std::string_view text, bool noExecuteActions = false);

    std::string resolve_code(std::string_view text) const;
    std::string resolve_placeholders(std::string_view text) const;
    std::string resolve_conditionals(std::string_view text) const;
    /// Merges template actions into result. A redirect inside a template
    /// replaces them and sets result.redirected.
    std::string resolve_templates(std::string_view text, bool noExecuteActions, ResolveResult& result);
    std::string resolve_speaker(std::string_view text);
    static std::string resolve_styles(std::string_view text);

    // Nested resolve_string calls in progress
    int depth() const { return depth_; }

private:
    // "name" or "name(a, b)" through the placeholder registry; nullopt when
    // the reference is malformed, unknown or its resolver throws.
    std::optional<std::string> resolve_placeholder(std::string_view reference) const;

    // "$id" or "$container.id" through the host, resolved recursively.
    std::optional<std::string> resolve_template(std::string_view reference, bool noExecuteActions,
                                                ResolveResult& result);

    const Registries& registries_;
    INarrativeHost& host_;
    const ActionResolver& actions_;
    ConditionalParser conditionals_;
    const core::NarrativeConfig& config_;

    int depth_{0};
};

} // namespace storyflow::narrative
