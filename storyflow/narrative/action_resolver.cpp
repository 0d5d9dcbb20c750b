#include "action_resolver.hpp"
#include "tolerant_json.hpp"

#include <exception>

#include <raylib.h>

namespace storyflow::narrative {

ActionResolver::ActionResolver(const Registries& registries)
    : registries_(registries) {}

ExtractionResult ActionResolver::extract_actions(std::string_view text, bool noExecuteActions) const {
    ExtractionResult result;

    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find('{', pos);
        if (open == std::string_view::npos) {
            result.output.append(text.substr(pos));
            break;
        }

        result.output.append(text.substr(pos, open - pos));

        int depth = 1;
        std::size_t close = std::string_view::npos;
        for (std::size_t i = open + 1; i < text.size(); ++i) {
            if (text[i] == '{') {
                ++depth;
            } else if (text[i] == '}') {
                if (--depth == 0) {
                    close = i;
                    break;
                }
            }
        }

        if (close == std::string_view::npos) {
            const std::string_view rest = text.substr(open);
            TraceLog(LOG_ERROR, "[narrative] Unmatched open brace in text: %.*s",
                     static_cast<int>(rest.size()), rest.data());
            result.output.append(rest);
            break;
        }

        const std::string_view block = text.substr(open, close - open + 1);
        pos = close + 1;

        auto parsed = TolerantJson::parse(block);
        if (!parsed) {
            TraceLog(LOG_ERROR, "[narrative] Failed to process action object \"%.*s\": %s",
                     static_cast<int>(block.size()), block.data(), parsed.error.c_str());
            continue;
        }
        if (!parsed.value.is_object()) {
            TraceLog(LOG_ERROR, "[narrative] Action block \"%.*s\" is not an object",
                     static_cast<int>(block.size()), block.data());
            continue;
        }

        ActionMap blockActions = ActionMap::from_json(parsed.value);

        if (blockActions.contains(kRedirectKey)) {
            ExtractionResult redirect;
            redirect.actions = std::move(blockActions);
            redirect.redirected = true;
            return redirect;
        }

        if (!noExecuteActions) {
            try {
                resolve_actions(blockActions, true);
            } catch (const std::exception& e) {
                TraceLog(LOG_ERROR, "[narrative] Action object \"%.*s\" failed: %s",
                         static_cast<int>(block.size()), block.data(), e.what());
            }
        }

        result.actions.merge(blockActions);
    }

    return result;
}

void ActionResolver::resolve_actions(const ActionMap& actions, bool skipDelayed) const {
    for (const auto& [name, payload] : actions) {
        if (is_clause_key(name)) {
            continue;
        }

        const ActionEntry* entry = registries_.actions.find(name);
        if (!entry) {
            TraceLog(LOG_ERROR, "[narrative] Action %s is not registered.", name.c_str());
            continue;
        }

        if (skipDelayed && entry->eventDelayed) {
            continue;
        }

        if (!entry->action) {
            continue;
        }

        // The action may re-register itself while it runs.
        const ActionFn action = entry->action;
        for (const auto& element : payload.elements()) {
            action(element);
        }
    }
}

bool ActionResolver::resolve_actions(std::string_view text, bool skipDelayed) const {
    auto parsed = TolerantJson::parse(text);
    if (!parsed || !parsed.value.is_object()) {
        TraceLog(LOG_ERROR, "[narrative] Cannot resolve actions from \"%.*s\": %s",
                 static_cast<int>(text.size()), text.data(),
                 parsed ? "not an object" : parsed.error.c_str());
        return false;
    }

    resolve_actions(ActionMap::from_json(parsed.value), skipDelayed);
    return true;
}

template <typename Pred>
ActionMap ActionResolver::filter(const ActionMap& actions, Pred pred) const {
    ActionMap out;
    for (const auto& [name, payload] : actions) {
        const ActionEntry* entry = registries_.actions.find(name);
        if (entry && pred(*entry)) {
            out.set(name, payload);
        }
    }
    return out;
}

ActionMap ActionResolver::get_delayed_actions(const ActionMap& actions) const {
    return filter(actions, [](const ActionEntry& e) { return e.eventDelayed; });
}

ActionMap ActionResolver::get_reload_actions(const ActionMap& actions) const {
    return filter(actions, [](const ActionEntry& e) { return e.onGameLoad; });
}

} // namespace storyflow::narrative
