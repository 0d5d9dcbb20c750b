#pragma once

#include "script_engine_base.hpp"

#include <storyflow/narrative/narrative_engine.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace storyflow::scripting {

class NarrativeAPI;

// Script engine for content packs. Scripts register conditions, actions,
// placeholders and trigger callbacks through the `narrative` table; every
// registration is undone when the scripts unload, restoring whatever entry
// it replaced.
class NarrativeScriptEngine : public ScriptEngineBase {
public:
    explicit NarrativeScriptEngine(narrative::NarrativeEngine& engine);
    ~NarrativeScriptEngine() override;

    // Read and load the given script files (first one is the main script)
    ScriptResult load_files(const std::vector<std::string>& paths);

    narrative::NarrativeEngine& narrative() { return engine_; }

    // Registrations on behalf of scripts (used by NarrativeAPI)
    void add_condition(const std::string& name, narrative::ConditionFn fn);
    void add_action(const std::string& name, narrative::ActionEntry entry);
    void add_placeholder(const std::string& name, narrative::PlaceholderFn fn);
    narrative::TriggerDispatcher::HandlerId add_trigger(const std::string& trigger,
                                                        narrative::TriggerCallback callback, int order);
    bool remove_trigger(narrative::TriggerDispatcher::HandlerId id);

    // Number of live registrations made by the loaded scripts
    std::size_t script_registration_count() const;

protected:
    void register_content_api(LuaState& lua) override;
    void register_constants(LuaState& lua) override;
    void on_scripts_unloaded() override;

private:
    template <typename Entry>
    struct Shadowed {
        std::string name;
        std::optional<Entry> previous;
    };

    template <typename Entry>
    static void remember(std::vector<Shadowed<Entry>>& list, const narrative::Registry<Entry>& registry,
                         const std::string& name);

    template <typename Entry, typename RegistryType>
    static void restore(std::vector<Shadowed<Entry>>& list, RegistryType& registry);

    narrative::NarrativeEngine& engine_;
    std::unique_ptr<NarrativeAPI> api_;

    std::vector<Shadowed<narrative::ConditionEntry>> conditions_;
    std::vector<Shadowed<narrative::ActionEntry>> actions_;
    std::vector<Shadowed<narrative::PlaceholderEntry>> placeholders_;
    std::vector<narrative::TriggerDispatcher::HandlerId> triggers_;

    friend class NarrativeAPI;
};

} // namespace storyflow::scripting
