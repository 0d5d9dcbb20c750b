#pragma once

#include "narrative_host.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace storyflow::narrative {

// In-memory host: container-scoped flags and template lines, plus the
// presentation slots. Used by the CLI and as the reference implementation
// of INarrativeHost.
class BasicNarrativeHost : public INarrativeHost {
public:
    BasicNarrativeHost() = default;
    explicit BasicNarrativeHost(ContainerId activeContainer);

    // INarrativeHost
    FlagValue get_flag(std::string_view flagPath) const override;
    void set_flag(std::string_view flagPath, FlagValue value) override;
    std::optional<std::string> find_template(std::string_view container,
                                             std::string_view templateId) const override;
    const ContainerId& active_container() const override { return activeContainer_; }
    void set_talking_character(std::optional<std::string> characterId) override;
    void record_visited_choice(std::string_view choiceId) override;

    void set_active_container(ContainerId container) { activeContainer_ = std::move(container); }

    void add_template(const ContainerId& container, const std::string& templateId, std::string text);

    // "container.$id = text" or "$id = text" per line, '#' starts a comment line.
    // Returns the number of lines added, or nullopt when the file cannot be read.
    std::optional<std::size_t> load_templates_from_file(const std::string& path);
    std::size_t load_templates_from_string(std::string_view text);

    const std::optional<std::string>& talking_character() const { return talkingCharacter_; }
    bool is_choice_visited(std::string_view choiceId) const;

private:
    // "container.flag" -> {container, flag}; bare ids use the active container.
    std::pair<ContainerId, std::string> split_path(std::string_view path) const;

    ContainerId activeContainer_;
    std::map<ContainerId, std::map<std::string, FlagValue, std::less<>>, std::less<>> flags_;
    std::map<ContainerId, std::map<std::string, std::string, std::less<>>, std::less<>> templates_;
    std::optional<std::string> talkingCharacter_;
    std::set<std::string, std::less<>> visitedChoices_;
};

} // namespace storyflow::narrative
