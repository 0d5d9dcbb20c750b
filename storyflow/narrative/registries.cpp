#include "registries.hpp"

#include <raylib.h>

namespace storyflow::narrative {

template <typename Entry>
bool Registry<Entry>::add(std::string name, Entry entry) {
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        TraceLog(LOG_WARNING, "[narrative] %s \"%s\" already exists - overwriting", kind_, name.c_str());
        it->second = std::move(entry);
        return true;
    }

    entries_.emplace(std::move(name), std::move(entry));
    return false;
}

template <typename Entry>
const Entry* Registry<Entry>::find(std::string_view name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

template <typename Entry>
bool Registry<Entry>::remove(std::string_view name) {
    auto it = entries_.find(name);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

template <typename Entry>
std::vector<std::string> Registry<Entry>::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        out.push_back(name);
    }
    return out;
}

template class Registry<ConditionEntry>;
template class Registry<ActionEntry>;
template class Registry<PlaceholderEntry>;

bool ConditionRegistry::register_condition(const std::string& name, ConditionFn fn) {
    if (name.empty() || name.front() != kConditionSigil) {
        throw RegistrationError("Error registering condition \"" + name +
                                "\": condition names need the _ prefix, e.g. _my_condition");
    }
    if (!fn) {
        throw RegistrationError("Error registering condition \"" + name + "\": empty evaluator");
    }

    ConditionEntry entry;
    entry.name = name;
    entry.evaluate = std::move(fn);
    return add(name, std::move(entry));
}

bool ActionRegistry::register_action(const std::string& name, ActionEntry entry) {
    entry.name = name;
    if (!entry.action) {
        entry.action = [](const ActionPayload&) {};
    }
    return add(name, std::move(entry));
}

bool ActionRegistry::register_action(const std::string& name, ActionFn fn) {
    ActionEntry entry;
    entry.action = std::move(fn);
    return register_action(name, std::move(entry));
}

bool PlaceholderRegistry::register_placeholder(const std::string& name, PlaceholderFn fn) {
    PlaceholderEntry entry;
    entry.name = name;
    entry.resolve = std::move(fn);
    return add(name, std::move(entry));
}

} // namespace storyflow::narrative
