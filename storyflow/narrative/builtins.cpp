#include "builtins.hpp"
#include "condition_evaluator.hpp"

#include <optional>
#include <utility>

#include <raylib.h>

namespace storyflow::narrative {

namespace {

constexpr const char* kFlagName = "flag";

std::optional<FlagOperation> parse_flag_term(std::string_view term) {
    static constexpr std::pair<char, FlagOperation::Op> kOperators[] = {
        {'=', FlagOperation::Op::Set},
        {'>', FlagOperation::Op::Add},
        {'<', FlagOperation::Op::Subtract},
    };

    for (const auto& [symbol, op] : kOperators) {
        const auto at = term.find(symbol);
        if (at == std::string_view::npos) {
            continue;
        }

        const std::string_view key = trim_view(term.substr(0, at));
        std::string_view rawValue = term.substr(at + 1);
        const auto extra = rawValue.find(symbol);
        if (extra != std::string_view::npos) {
            rawValue = rawValue.substr(0, extra);
        }
        rawValue = trim_view(rawValue);

        if (key.empty()) {
            break;
        }

        auto value = parse_number(rawValue);
        if (!value) {
            TraceLog(LOG_ERROR, "[narrative] Invalid flag value: \"%.*s\" for key \"%.*s\". Flags must be numbers.",
                     static_cast<int>(rawValue.size()), rawValue.data(),
                     static_cast<int>(key.size()), key.data());
            return std::nullopt;
        }

        return FlagOperation{std::string(key), op, *value};
    }

    TraceLog(LOG_ERROR, "[narrative] Invalid flag format: \"%.*s\". Use \"key=value\", \"key>value\", or \"key<value\"",
             static_cast<int>(term.size()), term.data());
    return std::nullopt;
}

} // namespace

std::vector<FlagOperation> parse_flag_operations(const ActionPayload& payload) {
    std::vector<FlagOperation> out;

    if (payload.is_keyed()) {
        for (auto it = payload.json().begin(); it != payload.json().end(); ++it) {
            const ActionPayload value(it.value());
            auto number = value.as_number();
            if (!number) {
                TraceLog(LOG_ERROR, "[narrative] Invalid flag value: \"%s\" for key \"%s\". Flags must be numbers.",
                         value.as_string().c_str(), it.key().c_str());
                continue;
            }
            out.push_back(FlagOperation{it.key(), FlagOperation::Op::Set, *number});
        }
        return out;
    }

    if (!payload.is_string()) {
        TraceLog(LOG_ERROR, "[narrative] Flag action expects \"key=value\" text or an object, got %s",
                 payload.as_string().c_str());
        return out;
    }

    for (const auto& term : ConditionEvaluator::split_args(payload.json().get_ref<const std::string&>())) {
        if (auto op = parse_flag_term(term)) {
            out.push_back(std::move(*op));
        }
    }
    return out;
}

void apply_flag_operations(const std::vector<FlagOperation>& operations, INarrativeHost& host,
                           const TriggerDispatcher& triggers) {
    for (const auto& operation : operations) {
        switch (operation.op) {
            case FlagOperation::Op::Set:
                host.set_flag(operation.key, operation.value);
                break;
            case FlagOperation::Op::Add:
                host.add_flag(operation.key, operation.value);
                break;
            case FlagOperation::Op::Subtract:
                host.add_flag(operation.key, -operation.value);
                break;
        }

        Json payload = Json::object();
        payload["flag"] = operation.key;
        payload["value"] = host.get_flag(operation.key);
        triggers.dispatch(kTriggerFlagChanged, payload);
    }
}

void register_builtins(Registries& registries, INarrativeHost& host, const TriggerDispatcher& triggers) {
    ActionEntry flag;
    flag.action = [&host, &triggers](const ActionPayload& payload) {
        apply_flag_operations(parse_flag_operations(payload), host, triggers);
        TraceLog(LOG_INFO, "[narrative] Flag operation(s): %s", payload.as_string().c_str());
    };
    registries.actions.register_action(kFlagName, std::move(flag));

    registries.placeholders.register_placeholder(kFlagName, [&host](const std::vector<std::string>& args) {
        if (args.empty() || args.front().empty()) {
            TraceLog(LOG_WARNING, "[narrative] |flag()| needs a flag id");
            return std::string("0");
        }
        return format_number(host.get_flag(args.front()));
    });
}

} // namespace storyflow::narrative
