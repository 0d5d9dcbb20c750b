#pragma once

#include <memory>
#include <optional>
#include <string>

namespace sol {
class state;
}

namespace storyflow::scripting {

// Outcome of loading or running a chunk
struct ScriptResult {
    bool success{false};
    std::string error;

    static ScriptResult ok() { return {true, ""}; }
    static ScriptResult fail(const std::string& err) { return {false, err}; }

    explicit operator bool() const { return success; }
};

// LuaJIT VM holding one content pack. Content authors are trusted: the
// standard libraries are open and nothing is limited.
class LuaState {
public:
    LuaState();
    ~LuaState();

    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;

    bool init();

    // Compile and run a chunk
    ScriptResult execute(const std::string& script, const std::string& chunkName = "script");

    // Compile only; reports syntax errors without running anything
    ScriptResult load(const std::string& script, const std::string& chunkName = "script");

    // Call a global function with no arguments
    ScriptResult call(const std::string& funcName);

    bool has_function(const std::string& funcName) const;

    // String global, nullopt when unset or of another type
    std::optional<std::string> get_global_string(const std::string& name) const;

    sol::state& state();

    // Drop the VM and start a fresh one; every global is gone
    void reset();

private:
    std::unique_ptr<sol::state> lua_;
};

// Initialized state for content scripts, nullptr on failure
std::unique_ptr<LuaState> create_content_state();

} // namespace storyflow::scripting
