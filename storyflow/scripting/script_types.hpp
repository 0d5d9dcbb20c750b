#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace storyflow::scripting {

// Lua sources of one content pack
struct ContentScriptData {
    // Main script content (entry point)
    std::string mainScript;
    std::string mainName{"main.lua"};

    // Additional module scripts, run before the main script
    struct Module {
        std::string name;
        std::string content;
    };
    std::vector<Module> modules;

    // Total size in bytes
    std::size_t total_size() const {
        std::size_t size = mainScript.size();
        for (const auto& mod : modules) {
            size += mod.name.size() + mod.content.size();
        }
        return size;
    }

    bool empty() const {
        return mainScript.empty() && modules.empty();
    }
};

} // namespace storyflow::scripting
