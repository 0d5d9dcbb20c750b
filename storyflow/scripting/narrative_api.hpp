#pragma once

#include "narrative_script_engine.hpp"

#include <sol/forward.hpp>

#include <string>
#include <tuple>

namespace storyflow::scripting {

// Content API exposed to scripts as the `narrative` table:
//
//   narrative.register_condition("_has_key", function(door) return true end)
//   narrative.register_action("music", { action = function(p) end, eventDelayed = false })
//   narrative.register_placeholder("hero", function() return "Alice" end)
//   narrative.on("choice", function(payload) return narrative.STOP end, 0)
//   local text, actions = narrative.resolve("Hello |hero|!")
//   narrative.get_flag("crypt.gold"), narrative.set_flag("gold", 3)
class NarrativeAPI {
public:
    explicit NarrativeAPI(NarrativeScriptEngine& engine);

    // Register all API functions with Lua state
    void register_api(sol::state& lua);

    // narrative.STOP / narrative.CONTINUE, Choice usertype
    static void register_constants(sol::state& lua);

private:
    void api_register_condition(const std::string& name, sol::protected_function fn);
    void api_register_action(const std::string& name, sol::object definition);
    void api_register_placeholder(const std::string& name, sol::protected_function fn);

    narrative::TriggerDispatcher::HandlerId api_on(const std::string& trigger, sol::protected_function fn,
                                                   sol::optional<int> order);

    std::tuple<std::string, sol::object> api_resolve(sol::this_state ts, const std::string& text,
                                                     sol::optional<bool> noExecuteActions);
    bool api_check(const std::string& conditions);
    std::string api_trigger(const std::string& trigger, sol::object payload);

    double api_get_flag(const std::string& path);
    void api_set_flag(const std::string& path, double value);
    void api_add_flag(const std::string& path, double delta);

    NarrativeScriptEngine& engine_;
};

} // namespace storyflow::scripting
