#include "script_engine_base.hpp"

#define SOL_ALL_SAFETIES_ON 1
#include <sol/sol.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <raylib.h>

namespace storyflow::scripting {

ScriptEngineBase::ScriptEngineBase() = default;
ScriptEngineBase::~ScriptEngineBase() = default;

bool ScriptEngineBase::init() {
    lua_ = create_content_state();
    if (!lua_) {
        lastError_ = "Failed to create Lua state";
        return false;
    }

    setup_base_api();
    register_constants(*lua_);
    register_content_api(*lua_);

    return true;
}

void ScriptEngineBase::setup_base_api() {
    if (!lua_) return;

    // Base API available to every script engine:
    // - print() routed to the log callback (or the trace log)
    // - log() as an alias

    auto& state = lua_->state();

    state["print"] = [this](sol::variadic_args va, sol::this_state ts) {
        sol::state_view lua(ts);
        std::ostringstream oss;

        bool first = true;
        for (auto v : va) {
            if (!first) oss << "\t";
            first = false;

            sol::protected_function tostring = lua["tostring"];
            if (tostring.valid()) {
                auto result = tostring(v);
                if (result.valid()) {
                    oss << result.get<std::string>();
                }
            }
        }

        if (logCallback_) {
            logCallback_("[script] " + oss.str());
        } else {
            TraceLog(LOG_INFO, "[script] %s", oss.str().c_str());
        }
    };

    state["log"] = state["print"];
}

ScriptResult ScriptEngineBase::load_scripts(const ContentScriptData& scripts) {
    if (!lua_) {
        return ScriptResult::fail("Engine not initialized");
    }

    unload();

    if (scripts.empty()) {
        return ScriptResult::ok();
    }

    // Syntax check everything before running anything
    for (const auto& mod : scripts.modules) {
        auto check = lua_->load(mod.content, mod.name);
        if (!check) {
            lastError_ = "Module '" + mod.name + "' syntax error: " + check.error;
            return ScriptResult::fail(lastError_);
        }
    }
    if (!scripts.mainScript.empty()) {
        auto check = lua_->load(scripts.mainScript, scripts.mainName);
        if (!check) {
            lastError_ = "Main script syntax error: " + check.error;
            return ScriptResult::fail(lastError_);
        }
    }

    // Load modules first (the main script may use what they define)
    for (const auto& mod : scripts.modules) {
        auto result = lua_->execute(mod.content, mod.name);
        if (!result) {
            lastError_ = "Failed to load module '" + mod.name + "': " + result.error;
            unload();
            return ScriptResult::fail(lastError_);
        }
    }

    if (!scripts.mainScript.empty()) {
        auto result = lua_->execute(scripts.mainScript, scripts.mainName);
        if (!result) {
            lastError_ = "Failed to load main script: " + result.error;
            unload();
            return ScriptResult::fail(lastError_);
        }
    }

    scriptsLoaded_ = true;

    // Call init hook if present
    if (lua_->has_function("on_init")) {
        call_hook("on_init");
    }

    return ScriptResult::ok();
}

ScriptResult ScriptEngineBase::read_script_files(const std::vector<std::string>& paths, ContentScriptData& out) {
    out = ContentScriptData{};

    for (std::size_t i = 0; i < paths.size(); ++i) {
        std::ifstream in(paths[i]);
        if (!in.is_open()) {
            return ScriptResult::fail("Cannot open script '" + paths[i] + "'");
        }

        std::ostringstream buffer;
        buffer << in.rdbuf();

        if (i == 0) {
            out.mainScript = buffer.str();
            out.mainName = std::filesystem::path(paths[i]).filename().string();
        } else {
            out.modules.push_back({std::filesystem::path(paths[i]).filename().string(), buffer.str()});
        }
    }

    return ScriptResult::ok();
}

void ScriptEngineBase::unload() {
    if (!lua_) return;

    // Call cleanup hook if present
    if (scriptsLoaded_ && lua_->has_function("on_unload")) {
        call_hook("on_unload");
    }

    scriptsLoaded_ = false;
    on_scripts_unloaded();

    // Fresh Lua state with the API registered again
    lua_->reset();
    setup_base_api();
    register_constants(*lua_);
    register_content_api(*lua_);
}

void ScriptEngineBase::shutdown() {
    if (!lua_) return;

    if (scriptsLoaded_ && lua_->has_function("on_unload")) {
        call_hook("on_unload");
    }

    scriptsLoaded_ = false;
    on_scripts_unloaded();
    lua_.reset();
}

void ScriptEngineBase::call_hook(const char* hookName) {
    if (!scriptsLoaded_ || !lua_) return;

    if (lua_->has_function(hookName)) {
        auto result = lua_->call(hookName);
        if (!result) {
            lastError_ = std::string("Hook '") + hookName + "' error: " + result.error;
            if (logCallback_) {
                logCallback_("[script error] " + lastError_);
            } else {
                TraceLog(LOG_ERROR, "[scripting] %s", lastError_.c_str());
            }
        }
    }
}

void ScriptEngineBase::set_log_callback(std::function<void(const std::string&)> callback) {
    logCallback_ = std::move(callback);
}

} // namespace storyflow::scripting
