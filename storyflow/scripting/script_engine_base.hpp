#pragma once

#include "lua_state.hpp"
#include "script_types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace storyflow::scripting {

// Base class for script engines.
// Owns the Lua state and the load/unload lifecycle of content scripts.
// Derived classes implement register_content_api() to expose their API.
class ScriptEngineBase {
public:
    ScriptEngineBase();
    virtual ~ScriptEngineBase();

    // Non-copyable
    ScriptEngineBase(const ScriptEngineBase&) = delete;
    ScriptEngineBase& operator=(const ScriptEngineBase&) = delete;

    // Create the Lua state and register the API
    bool init();

    // Load scripts: modules first, then the main script, then on_init()
    ScriptResult load_scripts(const ContentScriptData& scripts);

    // Read script files into ContentScriptData. The first path is the main
    // script, the rest are modules.
    static ScriptResult read_script_files(const std::vector<std::string>& paths, ContentScriptData& out);

    // Unload current scripts: on_unload(), then a fresh Lua state
    void unload();

    // Check if scripts are loaded
    bool has_scripts() const { return scriptsLoaded_; }

    // Access to underlying Lua state (for advanced usage)
    const LuaState* lua_state() const { return lua_.get(); }

    // Get last error message
    const std::string& last_error() const { return lastError_; }

    // Set logging callback for script print() calls
    void set_log_callback(std::function<void(const std::string&)> callback);

protected:
    // Override this to register the content API
    // Called after engine initialization and after every unload
    virtual void register_content_api(LuaState& lua) = 0;

    // Override this to setup constants
    virtual void register_constants(LuaState& lua) { (void)lua; }

    // Called before the Lua state is dropped; release everything that
    // references Lua values here.
    virtual void on_scripts_unloaded() {}

    // Call a Lua hook/callback by name (no args)
    void call_hook(const char* hookName);

    // Unload and destroy the Lua state. Derived destructors call this while
    // their overrides are still alive.
    void shutdown();

    // Access for derived classes
    void set_last_error(std::string error) { lastError_ = std::move(error); }

private:
    void setup_base_api();

    std::unique_ptr<LuaState> lua_;

    bool scriptsLoaded_{false};
    std::string lastError_;

    std::function<void(const std::string&)> logCallback_;
};

} // namespace storyflow::scripting
