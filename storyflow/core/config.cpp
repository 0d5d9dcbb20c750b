#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <raylib.h>

namespace storyflow::core {

Config::Config() {
    // Logging defaults
    config_.logging.enabled = true;
    config_.logging.level = LOG_INFO;
    config_.logging.file = "";
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    try {
        size_t idx = 0;
        int out = std::stoi(trim(v), &idx, 10);
        (void)idx;
        return out;
    } catch (const std::invalid_argument&) {
        return default_value;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

static std::string strip_quotes(std::string s) {
    s = Config::trim(std::move(s));

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

int Config::log_level_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    return parse_int(s, default_value);
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }

    if (sec == "narrative") {
        if (k == "max_resolve_depth") {
            config_.narrative.max_resolve_depth =
                std::max(1, parse_int(v, config_.narrative.max_resolve_depth));
        }
        else if (k == "code_class") config_.narrative.code_class = v;
        return;
    }

    if (sec == "content") {
        // Repeated keys accumulate.
        if (k == "script") config_.content.scripts.push_back(v);
        else if (k == "templates") config_.content.templates.push_back(v);
        else if (k == "start_container") config_.content.start_container = v;
        return;
    }
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;) - simplest approach: cut at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    load_from_string(buffer.str());

    loaded_from_path_ = path;
    return true;
}

} // namespace storyflow::core
