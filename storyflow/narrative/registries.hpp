#pragma once

#include "narrative_types.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow::narrative {

class Choice;

// Reserved first character of every condition name ("_room_visited").
inline constexpr char kConditionSigil = '_';

// ============================================================================
// Entries
// ============================================================================

using ConditionFn = std::function<ConditionValue(const std::vector<std::string>& args)>;
using ActionFn = std::function<void(const ActionPayload& payload)>;
using ChoiceModifierFn = std::function<void(Choice& choice, const ActionPayload& payload)>;
using PlaceholderFn = std::function<std::string(const std::vector<std::string>& args)>;

struct ConditionEntry {
    std::string name;
    ConditionFn evaluate;
};

struct ActionEntry {
    std::string name;
    ActionFn action;
    ChoiceModifierFn choiceModifier;  // optional

    // Runs only on a later explicit trigger (e.g. the next player choice).
    bool eventDelayed{false};

    // Re-run after a saved game loads; its side effects are not persisted.
    bool onGameLoad{false};
};

struct PlaceholderEntry {
    std::string name;
    PlaceholderFn resolve;
};

// ============================================================================
// Registry - name -> entry, overwrite allowed and logged
// ============================================================================

template <typename Entry>
class Registry {
public:
    explicit Registry(const char* kind) : kind_(kind) {}

    const Entry* find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }
    bool remove(std::string_view name);

    std::vector<std::string> names() const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    const char* kind() const { return kind_; }

protected:
    // Only the typed register functions add, after validating the entry.
    // Returns true when an existing entry was replaced.
    bool add(std::string name, Entry entry);

private:
    const char* kind_;
    std::map<std::string, Entry, std::less<>> entries_;
};

class ConditionRegistry : public Registry<ConditionEntry> {
public:
    ConditionRegistry() : Registry("Condition") {}

    // Throws RegistrationError when name does not start with kConditionSigil.
    // Returns true when an existing condition was replaced.
    bool register_condition(const std::string& name, ConditionFn fn);
};

class ActionRegistry : public Registry<ActionEntry> {
public:
    ActionRegistry() : Registry("Action") {}

    bool register_action(const std::string& name, ActionEntry entry);
    bool register_action(const std::string& name, ActionFn fn);
};

class PlaceholderRegistry : public Registry<PlaceholderEntry> {
public:
    PlaceholderRegistry() : Registry("Placeholder") {}

    bool register_placeholder(const std::string& name, PlaceholderFn fn);
};

// The three registries of one engine instance, injected into every collaborator.
struct Registries {
    ConditionRegistry conditions;
    ActionRegistry actions;
    PlaceholderRegistry placeholders;
};

extern template class Registry<ConditionEntry>;
extern template class Registry<ActionEntry>;
extern template class Registry<PlaceholderEntry>;

} // namespace storyflow::narrative
