#pragma once

#include "narrative_host.hpp"
#include "registries.hpp"
#include "trigger_dispatcher.hpp"

#include <string>
#include <vector>

namespace storyflow::narrative {

// One parsed term of the flag action: "gold=3", "crypt.keys>1", "hp<2".
struct FlagOperation {
    enum class Op : std::uint8_t { Set = 0, Add, Subtract };

    std::string key;
    Op op{Op::Set};
    double value{0.0};
};

/// "k=v, k>v, k<v" (set, add, subtract) or {k: v} (set). Malformed terms and
/// non-numeric values are logged and skipped.
std::vector<FlagOperation> parse_flag_operations(const ActionPayload& payload);

/// Applies the operations to the host and raises kTriggerFlagChanged for each.
void apply_flag_operations(const std::vector<FlagOperation>& operations, INarrativeHost& host,
                           const TriggerDispatcher& triggers);

/// Registers the engine's own entries: the "flag" action and the |flag(id)|
/// placeholder. Content may overwrite both.
void register_builtins(Registries& registries, INarrativeHost& host, const TriggerDispatcher& triggers);

} // namespace storyflow::narrative
