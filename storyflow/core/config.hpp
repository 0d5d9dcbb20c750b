#pragma once

#include <string>
#include <vector>

namespace storyflow::core {

struct LoggingConfig {
    bool enabled{true};
    int level{0};
    std::string file{};
};

struct NarrativeConfig {
    // Nested resolve_string calls (templates, redirects from actions) deeper
    // than this are refused.
    int max_resolve_depth{16};

    // CSS class wrapped around [code] blocks.
    std::string code_class{"output_code"};
};

struct ContentConfig {
    // Lua content scripts. The first one is the main script; the rest load
    // as modules before it.
    std::vector<std::string> scripts{};

    // Template line files ("container.$id = text" per line).
    std::vector<std::string> templates{};

    // Container that is active when the CLI starts.
    std::string start_container{};
};

struct StoryConfig {
    LoggingConfig logging{};
    NarrativeConfig narrative{};
    ContentConfig content{};
};

class Config {
public:
    Config();

    bool load_from_file(const std::string& path);
    void load_from_string(const std::string& text);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const StoryConfig& get() const { return config_; }

    const LoggingConfig& logging() const { return config_.logging; }
    const NarrativeConfig& narrative() const { return config_.narrative; }
    const ContentConfig& content() const { return config_.content; }

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

private:
    StoryConfig config_{};

    std::string loaded_from_path_{};

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);

    static int log_level_from_string(const std::string& v, int default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace storyflow::core
