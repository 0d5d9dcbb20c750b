/**
 * @file test_choice.cpp
 * @brief Tests for choice construction, gating, modifiers and taking a choice.
 */

#include <catch2/catch_test_macros.hpp>

#include "narrative_fixture.hpp"

using namespace storyflow::narrative;
using test_helpers::NarrativeFixture;
using test_helpers::params;

namespace {

ChoiceDefinition definition(std::string id, std::string name, std::string rawParams) {
    ChoiceDefinition def;
    def.id = std::move(id);
    def.name = std::move(name);
    def.params = std::move(rawParams);
    return def;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("Choice: params from near-JSON text", "[narrative][choice]") {
    NarrativeFixture fx;

    auto choice = fx.engine.create_custom_choice(
        definition("open", "Open the door", R"({if: "gold>5", active: "keys>0", door: north})"));

    REQUIRE(choice.id() == "open");
    REQUIRE(choice.name() == "Open the door");
    REQUIRE(choice.display_name() == "Open the door");
    REQUIRE(choice.params().keys() == std::vector<std::string>{"if", "active", "door"});
}

TEST_CASE("Choice: structured params", "[narrative][choice]") {
    NarrativeFixture fx;

    ChoiceDefinition def;
    def.id = "wait";
    def.name = "Wait";
    def.params = params("{ifOr: 'tired=1, night=1'}");

    auto choice = fx.engine.create_custom_choice(def);
    REQUIRE_FALSE(choice.is_visible());

    fx.host.set_flag("night", 1);
    REQUIRE(choice.is_visible());
}

TEST_CASE("Choice: unreadable params leave the choice ungated", "[narrative][choice]") {
    NarrativeFixture fx;

    auto choice = fx.engine.create_custom_choice(definition("x", "X", "{: nope"));
    REQUIRE(choice.params().empty());
    REQUIRE(choice.is_visible());
    REQUIRE(choice.is_available());

    auto empty = fx.engine.create_custom_choice(definition("y", "Y", "   "));
    REQUIRE(empty.params().empty());
}

// =============================================================================
// Gating
// =============================================================================

TEST_CASE("Choice: visibility and availability follow current flags", "[narrative][choice]") {
    NarrativeFixture fx;
    auto choice = fx.engine.create_custom_choice(
        definition("open", "Open", R"({if: "gold>5", active: "keys>0"})"));

    REQUIRE_FALSE(choice.is_visible());
    REQUIRE_FALSE(choice.is_available());

    fx.host.set_flag("gold", 6);
    REQUIRE(choice.is_visible());
    REQUIRE_FALSE(choice.is_available());

    fx.host.set_flag("keys", 1);
    REQUIRE(choice.is_available());
}

TEST_CASE("Choice: broken gates hide the choice", "[narrative][choice]") {
    NarrativeFixture fx;
    auto choice = fx.engine.create_custom_choice(definition("c", "C", R"({if: "_unknown=1"})"));

    bool visible = true;
    REQUIRE_NOTHROW(visible = choice.is_visible());
    REQUIRE_FALSE(visible);
    REQUIRE(choice.is_available());
}

TEST_CASE("Choice: default-constructed choice is ungated", "[narrative][choice]") {
    Choice choice;
    REQUIRE(choice.is_visible());
    REQUIRE(choice.is_available());
    REQUIRE(choice.display_name().empty());
}

// =============================================================================
// Modifiers
// =============================================================================

TEST_CASE("Choice: modifiers compute the display name", "[narrative][choice]") {
    NarrativeFixture fx;

    ActionEntry price;
    price.eventDelayed = true;
    price.choiceModifier = [&fx](Choice& choice, const ActionPayload& payload) {
        const std::string amount = payload.as_string();
        choice.set_display_name([&fx, amount](const Choice& c) {
            const bool affordable = fx.host.get_flag("gold") >= std::stod(amount);
            return c.name() + " (" + amount + " gold" + (affordable ? "" : ", too expensive") + ")";
        });
    };
    fx.engine.register_action("price", std::move(price));

    auto choice = fx.engine.create_custom_choice(definition("buy", "Buy a torch", "{price: 3}"));
    REQUIRE(choice.display_name() == "Buy a torch (3 gold, too expensive)");

    fx.host.set_flag("gold", 5);
    REQUIRE(choice.display_name() == "Buy a torch (3 gold)");
}

TEST_CASE("Choice: modifiers of absent actions are not called", "[narrative][choice]") {
    NarrativeFixture fx;
    int called = 0;

    ActionEntry mark;
    mark.choiceModifier = [&called](Choice&, const ActionPayload&) { ++called; };
    fx.engine.register_action("mark", std::move(mark));

    auto plain = fx.engine.create_custom_choice(definition("a", "A", "{other: 1}"));
    REQUIRE(called == 0);
    REQUIRE(plain.display_name() == "A");

    auto marked = fx.engine.create_custom_choice(definition("b", "B", "{mark: 1}"));
    REQUIRE(called == 1);
    REQUIRE(marked.display_name() == "B");
}

TEST_CASE("Choice: modifiers may rewrite the choice", "[narrative][choice]") {
    NarrativeFixture fx;

    ActionEntry rename;
    rename.choiceModifier = [](Choice& choice, const ActionPayload& payload) {
        choice.set_name(payload.as_string());
        ActionMap trimmed = choice.params();
        trimmed.erase("rename");
        choice.set_params(std::move(trimmed));
    };
    fx.engine.register_action("rename", std::move(rename));

    auto choice = fx.engine.create_custom_choice(definition("r", "Old", "{rename: New, music: x}"));
    REQUIRE(choice.display_name() == "New");
    REQUIRE(choice.params().keys() == std::vector<std::string>{"music"});
}

// =============================================================================
// Taking a choice
// =============================================================================

TEST_CASE("Choice: taking an available choice runs its actions", "[narrative][choice]") {
    NarrativeFixture fx;
    fx.record_action("travel", true);
    fx.host.set_flag("gold", 7);

    auto choice = fx.engine.create_custom_choice(
        definition("buy", "Buy", R"({active: "gold>=5", flag: "gold<5", travel: market})"));

    REQUIRE(fx.engine.perform_choice(choice));
    REQUIRE(fx.host.get_flag("gold") == 2);
    REQUIRE(fx.host.is_choice_visited("buy"));
    REQUIRE(fx.calls == std::vector<std::string>{"travel:market"});

    // Now unaffordable
    REQUIRE_FALSE(choice.is_available());
    REQUIRE_FALSE(fx.engine.perform_choice(choice));
    REQUIRE(fx.host.get_flag("gold") == 2);
}

TEST_CASE("Choice: the choice trigger can cancel", "[narrative][choice]") {
    NarrativeFixture fx;
    Json seen;
    fx.engine.on(std::string(kTriggerChoice), [&seen](const Json& payload) {
        seen = payload;
        return TriggerResult::Stop;
    });

    auto choice = fx.engine.create_custom_choice(definition("pray", "Pray", R"({flag: "faith>1"})"));

    REQUIRE_FALSE(fx.engine.perform_choice(choice));
    REQUIRE(seen["id"] == "pray");
    REQUIRE(seen["name"] == "Pray");
    REQUIRE(fx.host.get_flag("faith") == 0);
    REQUIRE_FALSE(fx.host.is_choice_visited("pray"));
}
