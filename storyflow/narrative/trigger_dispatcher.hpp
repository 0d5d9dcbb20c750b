#pragma once

#include "narrative_types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow::narrative {

// Trigger names raised by the engine itself.
inline constexpr std::string_view kTriggerChoice = "choice";
inline constexpr std::string_view kTriggerFlagChanged = "flag_changed";

using TriggerCallback = std::function<TriggerResult(const Json& payload)>;

// ============================================================================
// TriggerDispatcher - ordered callbacks, first Stop ends the dispatch
// ============================================================================

class TriggerDispatcher {
public:
    using HandlerId = std::uint64_t;

    /// Lower order runs first; equal orders run in registration order.
    HandlerId on(const std::string& trigger, TriggerCallback callback, int order = 0);
    bool off(HandlerId id);

    /// Stop as soon as a callback returns Stop, Continue otherwise (also
    /// when nothing listens). Callbacks added during dispatch wait for the
    /// next one.
    TriggerResult dispatch(std::string_view trigger, const Json& payload = Json()) const;

    std::size_t listener_count(std::string_view trigger) const;
    void clear() { handlers_.clear(); }

private:
    struct Handler {
        HandlerId id{0};
        int order{0};
        TriggerCallback callback;
    };

    std::map<std::string, std::vector<Handler>, std::less<>> handlers_;
    HandlerId nextId_{1};
};

} // namespace storyflow::narrative
