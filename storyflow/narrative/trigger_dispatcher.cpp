#include "trigger_dispatcher.hpp"

#include <algorithm>

namespace storyflow::narrative {

TriggerDispatcher::HandlerId TriggerDispatcher::on(const std::string& trigger, TriggerCallback callback, int order) {
    const HandlerId id = nextId_++;

    auto& list = handlers_[trigger];
    list.push_back(Handler{id, order, std::move(callback)});
    std::stable_sort(list.begin(), list.end(),
        [](const Handler& a, const Handler& b) { return a.order < b.order; });

    return id;
}

bool TriggerDispatcher::off(HandlerId id) {
    for (auto& [trigger, list] : handlers_) {
        auto it = std::find_if(list.begin(), list.end(),
            [id](const Handler& h) { return h.id == id; });
        if (it != list.end()) {
            list.erase(it);
            return true;
        }
    }
    return false;
}

TriggerResult TriggerDispatcher::dispatch(std::string_view trigger, const Json& payload) const {
    auto it = handlers_.find(trigger);
    if (it == handlers_.end()) {
        return TriggerResult::Continue;
    }

    // Callbacks may register or remove handlers.
    const std::vector<Handler> snapshot = it->second;
    for (const auto& handler : snapshot) {
        if (handler.callback && handler.callback(payload) == TriggerResult::Stop) {
            return TriggerResult::Stop;
        }
    }
    return TriggerResult::Continue;
}

std::size_t TriggerDispatcher::listener_count(std::string_view trigger) const {
    auto it = handlers_.find(trigger);
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace storyflow::narrative
