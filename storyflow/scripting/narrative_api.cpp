#include "narrative_api.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>

#include <raylib.h>

namespace storyflow::scripting {

namespace {

using narrative::Json;

constexpr const char* kStop = "stop";
constexpr const char* kContinue = "continue";

// Tables nested deeper than this are cut off (cycles).
constexpr int kMaxTableDepth = 32;

sol::object json_to_lua(sol::state_view lua, const Json& value) {
    if (value.is_null()) return sol::make_object(lua, sol::lua_nil);
    if (value.is_boolean()) return sol::make_object(lua, value.get<bool>());
    if (value.is_number()) return sol::make_object(lua, value.get<double>());
    if (value.is_string()) return sol::make_object(lua, value.get<std::string>());

    sol::table table = lua.create_table();
    if (value.is_array()) {
        int index = 1;
        for (const auto& item : value) {
            table[index++] = json_to_lua(lua, item);
        }
    } else {
        for (auto it = value.begin(); it != value.end(); ++it) {
            table[it.key()] = json_to_lua(lua, it.value());
        }
    }
    return sol::object(table);
}

Json lua_to_json(const sol::object& value, int depth = 0) {
    switch (value.get_type()) {
        case sol::type::boolean:
            return value.as<bool>();

        case sol::type::number: {
            const double number = value.as<double>();
            if (std::nearbyint(number) == number && std::fabs(number) < 9007199254740992.0) {
                return static_cast<std::int64_t>(number);
            }
            return number;
        }

        case sol::type::string:
            return value.as<std::string>();

        case sol::type::table: {
            if (depth >= kMaxTableDepth) {
                TraceLog(LOG_WARNING, "[scripting] Table nested too deep, truncated");
                return nullptr;
            }

            sol::table table = value.as<sol::table>();
            const std::size_t length = table.size();

            std::size_t count = 0;
            table.for_each([&count](const sol::object&, const sol::object&) { ++count; });

            if (length > 0 && count == length) {
                Json array = Json::array();
                for (std::size_t i = 1; i <= length; ++i) {
                    array.push_back(lua_to_json(table.get<sol::object>(i), depth + 1));
                }
                return array;
            }

            Json object = Json::object();
            table.for_each([&object, depth](const sol::object& key, const sol::object& item) {
                std::string name;
                if (key.get_type() == sol::type::string) {
                    name = key.as<std::string>();
                } else if (key.get_type() == sol::type::number) {
                    name = narrative::format_number(key.as<double>());
                } else {
                    return;
                }
                object[name] = lua_to_json(item, depth + 1);
            });
            return object;
        }

        default:
            return nullptr;
    }
}

narrative::ConditionValue to_condition_value(const sol::object& value) {
    switch (value.get_type()) {
        case sol::type::boolean: return value.as<bool>();
        case sol::type::number: return value.as<double>();
        case sol::type::string: return value.as<std::string>();
        case sol::type::table: return lua_to_json(value).dump();
        default: return std::monostate{};
    }
}

// First return value, nil when the function returned nothing.
sol::object first_result(const sol::protected_function_result& result) {
    if (result.return_count() == 0) {
        return sol::make_object(result.lua_state(), sol::lua_nil);
    }
    return result.get<sol::object>();
}

std::string error_of(const sol::protected_function_result& result) {
    sol::error err = result;
    return err.what();
}

} // namespace

NarrativeAPI::NarrativeAPI(NarrativeScriptEngine& engine) : engine_(engine) {}

void NarrativeAPI::register_constants(sol::state& lua) {
    auto narrative = lua.create_named_table("narrative");
    narrative["STOP"] = kStop;
    narrative["CONTINUE"] = kContinue;
    narrative["CONDITION_PREFIX"] = std::string(1, narrative::kConditionSigil);
}

void NarrativeAPI::register_api(sol::state& lua) {
    sol::table narrative = lua["narrative"].get_or_create<sol::table>();

    // Registration
    narrative["register_condition"] = [this](const std::string& name, sol::protected_function fn) {
        api_register_condition(name, std::move(fn));
    };
    narrative["register_action"] = [this](const std::string& name, sol::object definition) {
        api_register_action(name, std::move(definition));
    };
    narrative["register_placeholder"] = [this](const std::string& name, sol::protected_function fn) {
        api_register_placeholder(name, std::move(fn));
    };

    // Triggers
    narrative["on"] = [this](const std::string& trigger, sol::protected_function fn, sol::optional<int> order) {
        return api_on(trigger, std::move(fn), order);
    };
    narrative["off"] = [this](narrative::TriggerDispatcher::HandlerId id) {
        return engine_.remove_trigger(id);
    };
    narrative["trigger"] = [this](const std::string& trigger, sol::object payload) {
        return api_trigger(trigger, std::move(payload));
    };

    // Text and conditions
    narrative["resolve"] = [this](sol::this_state ts, const std::string& text, sol::optional<bool> noExecuteActions) {
        return api_resolve(ts, text, noExecuteActions);
    };
    narrative["check"] = [this](const std::string& conditions) { return api_check(conditions); };

    // Flags
    narrative["get_flag"] = [this](const std::string& path) { return api_get_flag(path); };
    narrative["set_flag"] = [this](const std::string& path, double value) { api_set_flag(path, value); };
    narrative["add_flag"] = [this](const std::string& path, double delta) { api_add_flag(path, delta); };

    // Choices handed to choiceModifier callbacks
    lua.new_usertype<narrative::Choice>("Choice",
        sol::no_constructor,
        "id", sol::readonly_property([](const narrative::Choice& c) { return c.id(); }),
        "name", sol::property(
            [](const narrative::Choice& c) { return c.name(); },
            [](narrative::Choice& c, const std::string& name) { c.set_name(name); }),
        "display_name", [](const narrative::Choice& c) { return c.display_name(); },
        "set_display_name", [this](narrative::Choice& c, const std::string& label) {
            // The label may hold |placeholders|; they are read whenever the name is shown.
            auto* pipeline = &engine_.narrative().pipeline();
            c.set_display_name([pipeline, label](const narrative::Choice&) {
                return pipeline->resolve_placeholders(label);
            });
        },
        "params", [](sol::this_state ts, const narrative::Choice& c) {
            return json_to_lua(sol::state_view(ts), c.params().to_json());
        },
        "is_visible", [](const narrative::Choice& c) { return c.is_visible(); },
        "is_available", [](const narrative::Choice& c) { return c.is_available(); }
    );
}

// ============================================================================
// Registration
// ============================================================================

void NarrativeAPI::api_register_condition(const std::string& name, sol::protected_function fn) {
    engine_.add_condition(name, [fn, name](const std::vector<std::string>& args) -> narrative::ConditionValue {
        auto result = fn(sol::as_args(args));
        if (!result.valid()) {
            TraceLog(LOG_ERROR, "[scripting] Condition %s failed: %s", name.c_str(), error_of(result).c_str());
            return std::monostate{};
        }
        return to_condition_value(first_result(result));
    });
}

void NarrativeAPI::api_register_action(const std::string& name, sol::object definition) {
    sol::object action = sol::lua_nil;
    sol::object modifier = sol::lua_nil;

    narrative::ActionEntry entry;

    if (definition.get_type() == sol::type::function) {
        action = definition;
    } else if (definition.get_type() == sol::type::table) {
        sol::table table = definition.as<sol::table>();
        action = table["action"];
        modifier = table["choiceModifier"];
        entry.eventDelayed = table.get_or("eventDelayed", false);
        entry.onGameLoad = table.get_or("onGameLoad", false);
    } else {
        throw std::invalid_argument("register_action(\"" + name + "\") expects a function or a table");
    }

    if (action.get_type() == sol::type::function) {
        sol::protected_function fn = action.as<sol::protected_function>();
        entry.action = [fn, name](const narrative::ActionPayload& payload) {
            sol::state_view lua(fn.lua_state());
            auto result = fn(json_to_lua(lua, payload.json()));
            if (!result.valid()) {
                TraceLog(LOG_ERROR, "[scripting] Action %s failed: %s", name.c_str(), error_of(result).c_str());
            }
        };
    }

    if (modifier.get_type() == sol::type::function) {
        sol::protected_function fn = modifier.as<sol::protected_function>();
        entry.choiceModifier = [fn, name](narrative::Choice& choice, const narrative::ActionPayload& payload) {
            sol::state_view lua(fn.lua_state());
            auto result = fn(&choice, json_to_lua(lua, payload.json()));
            if (!result.valid()) {
                TraceLog(LOG_ERROR, "[scripting] Choice modifier %s failed: %s", name.c_str(),
                         error_of(result).c_str());
            }
        };
    }

    engine_.add_action(name, std::move(entry));
}

void NarrativeAPI::api_register_placeholder(const std::string& name, sol::protected_function fn) {
    engine_.add_placeholder(name, [fn, name](const std::vector<std::string>& args) -> std::string {
        auto result = fn(sol::as_args(args));
        if (!result.valid()) {
            throw std::runtime_error("script error: " + error_of(result));
        }
        return narrative::to_display_string(to_condition_value(first_result(result)));
    });
}

narrative::TriggerDispatcher::HandlerId NarrativeAPI::api_on(const std::string& trigger, sol::protected_function fn,
                                                             sol::optional<int> order) {
    auto callback = [fn, trigger](const Json& payload) {
        sol::state_view lua(fn.lua_state());
        auto result = fn(json_to_lua(lua, payload));
        if (!result.valid()) {
            TraceLog(LOG_ERROR, "[scripting] Trigger callback for %s failed: %s", trigger.c_str(),
                     error_of(result).c_str());
            return narrative::TriggerResult::Continue;
        }

        const sol::object value = first_result(result);
        if (value.get_type() == sol::type::string && value.as<std::string>() == kStop) {
            return narrative::TriggerResult::Stop;
        }
        return narrative::TriggerResult::Continue;
    };

    return engine_.add_trigger(trigger, std::move(callback), order.value_or(0));
}

// ============================================================================
// Text, conditions, flags
// ============================================================================

std::tuple<std::string, sol::object> NarrativeAPI::api_resolve(sol::this_state ts, const std::string& text,
                                                               sol::optional<bool> noExecuteActions) {
    auto result = engine_.narrative().resolve_string(text, noExecuteActions.value_or(false));
    return {std::move(result.output), json_to_lua(sol::state_view(ts), result.actions.to_json())};
}

bool NarrativeAPI::api_check(const std::string& conditions) {
    return engine_.narrative().evaluator().evaluate_all(conditions);
}

std::string NarrativeAPI::api_trigger(const std::string& trigger, sol::object payload) {
    const auto result = engine_.narrative().trigger(trigger, lua_to_json(payload));
    return result == narrative::TriggerResult::Stop ? kStop : kContinue;
}

double NarrativeAPI::api_get_flag(const std::string& path) {
    return engine_.narrative().host().get_flag(path);
}

void NarrativeAPI::api_set_flag(const std::string& path, double value) {
    engine_.narrative().host().set_flag(path, value);
}

void NarrativeAPI::api_add_flag(const std::string& path, double delta) {
    engine_.narrative().host().add_flag(path, delta);
}

} // namespace storyflow::scripting
