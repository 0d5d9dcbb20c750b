#pragma once

#include "narrative_types.hpp"
#include "registries.hpp"

#include <string>
#include <string_view>

namespace storyflow::narrative {

// Text with its embedded action objects removed, plus what they contained.
struct ExtractionResult {
    std::string output;
    ActionMap actions;

    // An object carried the redirect key: output is empty and actions holds
    // only that object. The rest of the fragment was not looked at.
    bool redirected{false};
};

// ============================================================================
// ActionResolver - finds {...} action objects in text and runs actions
// ============================================================================

class ActionResolver {
public:
    explicit ActionResolver(const Registries& registries);

    /// Cuts every balanced {...} group out of text and parses it as tolerant
    /// JSON. Non-delayed actions run immediately unless noExecuteActions.
    /// Groups that fail to parse are dropped from the output and logged.
    /// An unmatched '{' stops extraction; the rest is kept as-is.
    ExtractionResult extract_actions(std::string_view text, bool noExecuteActions = false) const;

    /// Runs every registered action named in actions (clause keys excluded),
    /// once per element for Sequence payloads. Unregistered names are logged
    /// and skipped.
    void resolve_actions(const ActionMap& actions, bool skipDelayed = false) const;

    /// Same, from near-JSON text. Returns false when the text does not parse
    /// to an object.
    bool resolve_actions(std::string_view text, bool skipDelayed = false) const;

    /// Subset of actions whose registered entry is eventDelayed.
    ActionMap get_delayed_actions(const ActionMap& actions) const;

    /// Subset of actions whose registered entry is onGameLoad.
    ActionMap get_reload_actions(const ActionMap& actions) const;

private:
    template <typename Pred>
    ActionMap filter(const ActionMap& actions, Pred pred) const;

    const Registries& registries_;
};

} // namespace storyflow::narrative
