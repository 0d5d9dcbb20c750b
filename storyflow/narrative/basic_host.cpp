#include "basic_host.hpp"

#include <storyflow/core/config.hpp>

#include <fstream>
#include <sstream>

#include <raylib.h>

namespace storyflow::narrative {

BasicNarrativeHost::BasicNarrativeHost(ContainerId activeContainer)
    : activeContainer_(std::move(activeContainer)) {}

std::pair<ContainerId, std::string> BasicNarrativeHost::split_path(std::string_view path) const {
    const auto dot = path.find(kPathSeparator);
    if (dot != std::string_view::npos && path.find(kPathSeparator, dot + 1) == std::string_view::npos) {
        return {ContainerId(path.substr(0, dot)), std::string(path.substr(dot + 1))};
    }
    return {activeContainer_, std::string(path)};
}

FlagValue BasicNarrativeHost::get_flag(std::string_view flagPath) const {
    auto [container, flag] = split_path(flagPath);

    auto cit = flags_.find(container);
    if (cit == flags_.end()) return 0.0;

    auto fit = cit->second.find(flag);
    if (fit == cit->second.end()) return 0.0;

    return fit->second;
}

void BasicNarrativeHost::set_flag(std::string_view flagPath, FlagValue value) {
    auto [container, flag] = split_path(flagPath);
    flags_[container][flag] = value;
}

std::optional<std::string> BasicNarrativeHost::find_template(std::string_view container,
                                                             std::string_view templateId) const {
    const ContainerId scope = container.empty() ? activeContainer_ : ContainerId(container);

    auto cit = templates_.find(scope);
    if (cit == templates_.end()) return std::nullopt;

    auto tit = cit->second.find(templateId);
    if (tit == cit->second.end()) return std::nullopt;

    return tit->second;
}

void BasicNarrativeHost::set_talking_character(std::optional<std::string> characterId) {
    talkingCharacter_ = std::move(characterId);
}

void BasicNarrativeHost::record_visited_choice(std::string_view choiceId) {
    visitedChoices_.emplace(choiceId);
}

bool BasicNarrativeHost::is_choice_visited(std::string_view choiceId) const {
    return visitedChoices_.find(choiceId) != visitedChoices_.end();
}

void BasicNarrativeHost::add_template(const ContainerId& container, const std::string& templateId,
                                      std::string text) {
    templates_[container][templateId] = std::move(text);
}

std::size_t BasicNarrativeHost::load_templates_from_string(std::string_view text) {
    std::istringstream in{std::string(text)};
    std::string line;
    std::size_t added = 0;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        const std::string trimmed = core::Config::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        const auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            TraceLog(LOG_WARNING, "[narrative] Template line %d has no '=': %s", lineNo, trimmed.c_str());
            continue;
        }

        const std::string key = core::Config::trim(trimmed.substr(0, eq));
        const std::string value = core::Config::trim(trimmed.substr(eq + 1));

        ContainerId container = activeContainer_;
        std::string id = key;
        const auto dot = key.find(kPathSeparator);
        if (dot != std::string::npos) {
            container = key.substr(0, dot);
            id = key.substr(dot + 1);
        }

        if (id.empty() || id.front() != '$') {
            TraceLog(LOG_WARNING, "[narrative] Template id must start with '$' (line %d): %s",
                     lineNo, key.c_str());
            continue;
        }

        add_template(container, id, value);
        ++added;
    }

    return added;
}

std::optional<std::size_t> BasicNarrativeHost::load_templates_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        TraceLog(LOG_ERROR, "[narrative] Cannot open template file '%s'", path.c_str());
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::size_t added = load_templates_from_string(buffer.str());
    TraceLog(LOG_INFO, "[narrative] Loaded %zu template line(s) from '%s'", added, path.c_str());
    return added;
}

} // namespace storyflow::narrative
