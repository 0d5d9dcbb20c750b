/**
 * @file test_builtins.cpp
 * @brief Tests for the engine's own flag action and flag placeholder.
 */

#include <catch2/catch_test_macros.hpp>

#include <storyflow/narrative/builtins.hpp>

#include "narrative_fixture.hpp"

using namespace storyflow::narrative;
using test_helpers::NarrativeFixture;

using Op = FlagOperation::Op;

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("Builtins: flag operations from text", "[narrative][builtins]") {
    test_helpers::QuietLogs quiet;
    auto ops = parse_flag_operations(ActionPayload::from_string("gold=3, crypt.keys>1, hp<2.5"));

    REQUIRE(ops.size() == 3);
    REQUIRE(ops[0].key == "gold");
    REQUIRE(ops[0].op == Op::Set);
    REQUIRE(ops[0].value == 3);
    REQUIRE(ops[1].key == "crypt.keys");
    REQUIRE(ops[1].op == Op::Add);
    REQUIRE(ops[2].key == "hp");
    REQUIRE(ops[2].op == Op::Subtract);
    REQUIRE(ops[2].value == 2.5);
}

TEST_CASE("Builtins: flag operations from an object", "[narrative][builtins]") {
    test_helpers::QuietLogs quiet;
    auto ops = parse_flag_operations(ActionPayload(Json{{"gold", 4}, {"door", "1"}}));

    REQUIRE(ops.size() == 2);
    REQUIRE(ops[0].key == "gold");
    REQUIRE(ops[0].op == Op::Set);
    REQUIRE(ops[1].value == 1);
}

TEST_CASE("Builtins: non-numeric flag values are skipped", "[narrative][builtins]") {
    test_helpers::QuietLogs quiet;

    REQUIRE(parse_flag_operations(ActionPayload::from_string("gold=lots, hp=2")).size() == 1);
    REQUIRE(parse_flag_operations(ActionPayload::from_string("nonsense")).empty());
    REQUIRE(parse_flag_operations(ActionPayload::from_string("=3")).empty());
    REQUIRE(parse_flag_operations(ActionPayload(Json{{"gold", "many"}})).empty());
    REQUIRE(parse_flag_operations(ActionPayload(Json(true))).empty());
}

// =============================================================================
// flag action
// =============================================================================

TEST_CASE("Builtins: flag action changes host flags", "[narrative][builtins]") {
    NarrativeFixture fx;

    REQUIRE(fx.engine.resolve_string("{flag: 'gold=10'}Done").output == "Done");
    REQUIRE(fx.host.get_flag("gold") == 10);

    fx.engine.resolve_string("{flag: 'gold>5, gold<2, chapel.bells>1'}");
    REQUIRE(fx.host.get_flag("gold") == 13);
    REQUIRE(fx.host.get_flag("chapel.bells") == 1);

    fx.engine.resolve_string("{flag: {gold: 0}}");
    REQUIRE(fx.host.get_flag("gold") == 0);
}

TEST_CASE("Builtins: flag action raises flag_changed", "[narrative][builtins]") {
    NarrativeFixture fx;
    std::vector<Json> changes;
    fx.engine.on(std::string(kTriggerFlagChanged), [&changes](const Json& payload) {
        changes.push_back(payload);
        return TriggerResult::Continue;
    });

    fx.engine.resolve_string("{flag: 'gold=2, gold>3'}");

    REQUIRE(changes.size() == 2);
    REQUIRE(changes[0]["flag"] == "gold");
    REQUIRE(changes[0]["value"] == 2.0);
    REQUIRE(changes[1]["value"] == 5.0);
}

TEST_CASE("Builtins: flag sequences apply in order", "[narrative][builtins]") {
    NarrativeFixture fx;
    fx.engine.resolve_string("{flag: ['gold=1', 'gold>4']}");
    REQUIRE(fx.host.get_flag("gold") == 5);
}

// =============================================================================
// flag placeholder
// =============================================================================

TEST_CASE("Builtins: flag placeholder", "[narrative][builtins]") {
    NarrativeFixture fx;
    fx.host.set_flag("gold", 10);
    fx.host.set_flag("chapel.weight", 2.5);

    REQUIRE(fx.engine.resolve_string("You have |flag(gold)| gold.").output == "You have 10 gold.");
    REQUIRE(fx.engine.resolve_string("|flag(chapel.weight)|").output == "2.5");
    REQUIRE(fx.engine.resolve_string("|flag(unset)|").output == "0");
    REQUIRE(fx.engine.resolve_string("|flag()|").output == "0");
}

TEST_CASE("Builtins: flag placeholder number formatting", "[narrative][builtins]") {
    NarrativeFixture fx;
    fx.host.set_flag("tiny", 1e-7);
    fx.host.set_flag("small", 1e-6);
    fx.host.set_flag("debt", -0.1);
    fx.host.set_flag("huge", 1e21);

    REQUIRE(fx.engine.resolve_string("|flag(tiny)|").output == "1e-7");
    REQUIRE(fx.engine.resolve_string("|flag(small)|").output == "0.000001");
    REQUIRE(fx.engine.resolve_string("|flag(debt)|").output == "-0.1");
    REQUIRE(fx.engine.resolve_string("|flag(huge)|").output == "1e+21");
}

TEST_CASE("Builtins: numbers print with shortest digits", "[narrative][builtins]") {
    REQUIRE(format_number(3) == "3");
    REQUIRE(format_number(-42) == "-42");
    REQUIRE(format_number(0.1 + 0.2) == "0.30000000000000004");
    REQUIRE(format_number(1e20) == "100000000000000000000");
    REQUIRE(format_number(123.456) == "123.456");
    REQUIRE(format_number(2.5e-8) == "2.5e-8");
    REQUIRE(format_number(1.5e300) == "1.5e+300");
    REQUIRE(format_number(-0.0) == "0");
}

TEST_CASE("Builtins: content can replace or skip the built-ins", "[narrative][builtins]") {
    test_helpers::QuietLogs quiet;
    BasicNarrativeHost host("crypt");

    NarrativeEngine bare(host, {}, false);
    REQUIRE_FALSE(bare.registries().actions.contains("flag"));
    REQUIRE_FALSE(bare.registries().placeholders.contains("flag"));

    NarrativeEngine custom(host);
    custom.register_placeholder("flag", [](const std::vector<std::string>&) { return std::string("hidden"); });
    REQUIRE(custom.resolve_string("|flag(gold)|").output == "hidden");
}
