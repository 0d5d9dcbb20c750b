#include "lua_state.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

namespace storyflow::scripting {

namespace {

std::unique_ptr<sol::state> open_content_state() {
    auto lua = std::make_unique<sol::state>();
    if (!lua->lua_state()) {
        return nullptr;
    }

    lua->open_libraries(sol::lib::base, sol::lib::coroutine, sol::lib::string,
                        sol::lib::table, sol::lib::math, sol::lib::utf8);
    return lua;
}

template <typename Result>
ScriptResult to_script_result(Result&& result) {
    if (result.valid()) {
        return ScriptResult::ok();
    }
    sol::error err = result;
    return ScriptResult::fail(err.what());
}

} // namespace

LuaState::LuaState() = default;
LuaState::~LuaState() = default;

bool LuaState::init() {
    lua_ = open_content_state();
    return lua_ != nullptr;
}

ScriptResult LuaState::execute(const std::string& script, const std::string& chunkName) {
    return to_script_result(lua_->safe_script(script, sol::script_pass_on_error, chunkName));
}

ScriptResult LuaState::load(const std::string& script, const std::string& chunkName) {
    return to_script_result(lua_->load(script, chunkName));
}

ScriptResult LuaState::call(const std::string& funcName) {
    sol::protected_function fn = (*lua_)[funcName];
    if (!fn.valid()) {
        return ScriptResult::fail("function '" + funcName + "' not found");
    }
    return to_script_result(fn());
}

bool LuaState::has_function(const std::string& funcName) const {
    sol::object value = (*lua_)[funcName];
    return value.get_type() == sol::type::function;
}

std::optional<std::string> LuaState::get_global_string(const std::string& name) const {
    sol::object value = (*lua_)[name];
    if (value.get_type() != sol::type::string) {
        return std::nullopt;
    }
    return value.as<std::string>();
}

sol::state& LuaState::state() {
    return *lua_;
}

void LuaState::reset() {
    lua_.reset();
    lua_ = open_content_state();
}

std::unique_ptr<LuaState> create_content_state() {
    auto state = std::make_unique<LuaState>();
    if (!state->init()) {
        return nullptr;
    }
    return state;
}

} // namespace storyflow::scripting
