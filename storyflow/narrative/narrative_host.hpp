#pragma once

#include <storyflow/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace storyflow::narrative {

// ============================================================================
// INarrativeHost - the game runtime provides this to the narrative core
// ============================================================================

class INarrativeHost {
public:
    virtual ~INarrativeHost() = default;

    // --- Flags ---

    /// Read a flag: "flagId" (active container) or "container.flagId".
    /// Unknown flags read as 0.
    virtual FlagValue get_flag(std::string_view flagPath) const = 0;

    /// Overwrite a flag (same path rules as get_flag).
    virtual void set_flag(std::string_view flagPath, FlagValue value) = 0;

    /// Add to a flag (same path rules as get_flag).
    virtual void add_flag(std::string_view flagPath, FlagValue delta) {
        set_flag(flagPath, get_flag(flagPath) + delta);
    }

    // --- Content ---

    /// Raw text of a named line ("$intro") in a container; empty container
    /// means the active one.
    virtual std::optional<std::string> find_template(std::string_view container,
                                                     std::string_view templateId) const = 0;

    /// Container used when a path carries no explicit scope.
    virtual const ContainerId& active_container() const = 0;

    // --- Presentation state ---

    /// Character speaking the fragment being resolved; nullopt clears it.
    virtual void set_talking_character(std::optional<std::string> characterId) = 0;

    /// Record that a choice was taken (used for "already seen" styling).
    virtual void record_visited_choice(std::string_view choiceId) { (void)choiceId; }
};

} // namespace storyflow::narrative
