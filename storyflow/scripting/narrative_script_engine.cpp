#include "narrative_script_engine.hpp"
#include "narrative_api.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <algorithm>

#include <raylib.h>

namespace storyflow::scripting {

namespace {

// Shadowed entries go back through the typed register functions.
void reinstate(narrative::ConditionRegistry& registry, narrative::ConditionEntry entry) {
    registry.register_condition(entry.name, std::move(entry.evaluate));
}

void reinstate(narrative::ActionRegistry& registry, narrative::ActionEntry entry) {
    const std::string name = entry.name;
    registry.register_action(name, std::move(entry));
}

void reinstate(narrative::PlaceholderRegistry& registry, narrative::PlaceholderEntry entry) {
    registry.register_placeholder(entry.name, std::move(entry.resolve));
}

} // namespace

NarrativeScriptEngine::NarrativeScriptEngine(narrative::NarrativeEngine& engine)
    : engine_(engine)
    , api_(std::make_unique<NarrativeAPI>(*this)) {}

NarrativeScriptEngine::~NarrativeScriptEngine() {
    shutdown();
}

ScriptResult NarrativeScriptEngine::load_files(const std::vector<std::string>& paths) {
    ContentScriptData data;
    auto read = read_script_files(paths, data);
    if (!read) {
        set_last_error(read.error);
        return read;
    }

    auto result = load_scripts(data);
    if (result) {
        TraceLog(LOG_INFO, "[scripting] Loaded %zu script(s), %zu bytes, %zu registration(s)",
                 paths.size(), data.total_size(), script_registration_count());
    }
    return result;
}

// ============================================================================
// Registration tracking
// ============================================================================

template <typename Entry>
void NarrativeScriptEngine::remember(std::vector<Shadowed<Entry>>& list, const narrative::Registry<Entry>& registry,
                                     const std::string& name) {
    for (const auto& shadowed : list) {
        if (shadowed.name == name) return;
    }

    Shadowed<Entry> shadowed;
    shadowed.name = name;
    if (const Entry* existing = registry.find(name)) {
        shadowed.previous = *existing;
    }
    list.push_back(std::move(shadowed));
}

template <typename Entry, typename RegistryType>
void NarrativeScriptEngine::restore(std::vector<Shadowed<Entry>>& list, RegistryType& registry) {
    for (auto it = list.rbegin(); it != list.rend(); ++it) {
        registry.remove(it->name);
        if (it->previous) {
            reinstate(registry, std::move(*it->previous));
        }
    }
    list.clear();
}

void NarrativeScriptEngine::add_condition(const std::string& name, narrative::ConditionFn fn) {
    // Validates the name before anything is remembered.
    if (name.empty() || name.front() != narrative::kConditionSigil) {
        engine_.register_condition(name, std::move(fn));
        return;
    }

    remember(conditions_, engine_.registries().conditions, name);
    engine_.register_condition(name, std::move(fn));
}

void NarrativeScriptEngine::add_action(const std::string& name, narrative::ActionEntry entry) {
    remember(actions_, engine_.registries().actions, name);
    engine_.register_action(name, std::move(entry));
}

void NarrativeScriptEngine::add_placeholder(const std::string& name, narrative::PlaceholderFn fn) {
    remember(placeholders_, engine_.registries().placeholders, name);
    engine_.register_placeholder(name, std::move(fn));
}

narrative::TriggerDispatcher::HandlerId NarrativeScriptEngine::add_trigger(const std::string& trigger,
                                                                           narrative::TriggerCallback callback,
                                                                           int order) {
    const auto id = engine_.on(trigger, std::move(callback), order);
    triggers_.push_back(id);
    return id;
}

bool NarrativeScriptEngine::remove_trigger(narrative::TriggerDispatcher::HandlerId id) {
    auto it = std::find(triggers_.begin(), triggers_.end(), id);
    if (it == triggers_.end()) {
        return false;
    }
    triggers_.erase(it);
    return engine_.off(id);
}

std::size_t NarrativeScriptEngine::script_registration_count() const {
    return conditions_.size() + actions_.size() + placeholders_.size() + triggers_.size();
}

// ============================================================================
// Lifecycle
// ============================================================================

void NarrativeScriptEngine::register_content_api(LuaState& lua) {
    api_->register_api(lua.state());
}

void NarrativeScriptEngine::register_constants(LuaState& lua) {
    NarrativeAPI::register_constants(lua.state());
}

void NarrativeScriptEngine::on_scripts_unloaded() {
    auto& registries = engine_.registries();
    restore(conditions_, registries.conditions);
    restore(actions_, registries.actions);
    restore(placeholders_, registries.placeholders);

    for (auto id : triggers_) {
        engine_.off(id);
    }
    triggers_.clear();
}

} // namespace storyflow::scripting
