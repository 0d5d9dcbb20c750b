/**
 * @file test_registries.cpp
 * @brief Unit tests for the condition, action and placeholder registries.
 */

#include <catch2/catch_test_macros.hpp>

#include <storyflow/narrative/registries.hpp>

#include "narrative_fixture.hpp"

using namespace storyflow::narrative;

namespace {

ConditionValue always_true(const std::vector<std::string>&) {
    return true;
}

// Entries only get in through the validating register functions.
template <typename RegistryType, typename Entry>
concept AddsUnchecked = requires(RegistryType& registry, Entry entry) {
    registry.add(std::string("visited"), entry);
};

static_assert(!AddsUnchecked<ConditionRegistry, ConditionEntry>);
static_assert(!AddsUnchecked<ActionRegistry, ActionEntry>);
static_assert(!AddsUnchecked<PlaceholderRegistry, PlaceholderEntry>);

} // namespace

// =============================================================================
// Conditions
// =============================================================================

TEST_CASE("Registries: condition names need the sigil", "[narrative][registry]") {
    test_helpers::QuietLogs quiet;
    ConditionRegistry conditions;

    REQUIRE_THROWS_AS(conditions.register_condition("visited", always_true), RegistrationError);
    REQUIRE_THROWS_AS(conditions.register_condition("", always_true), RegistrationError);
    REQUIRE(conditions.empty());

    conditions.register_condition("_visited", always_true);
    REQUIRE(conditions.contains("_visited"));
    REQUIRE(conditions.find("_visited")->name == "_visited");
}

TEST_CASE("Registries: empty condition evaluator is refused", "[narrative][registry]") {
    test_helpers::QuietLogs quiet;
    ConditionRegistry conditions;

    REQUIRE_THROWS_AS(conditions.register_condition("_empty", ConditionFn{}), RegistrationError);
    REQUIRE_FALSE(conditions.contains("_empty"));
}

// =============================================================================
// Overwrite
// =============================================================================

TEST_CASE("Registries: re-registration overwrites", "[narrative][registry]") {
    test_helpers::QuietLogs quiet;
    PlaceholderRegistry placeholders;

    placeholders.register_placeholder("hero", [](const std::vector<std::string>&) { return std::string("Alice"); });
    placeholders.register_placeholder("hero", [](const std::vector<std::string>&) { return std::string("Bob"); });

    REQUIRE(placeholders.size() == 1);
    REQUIRE(placeholders.find("hero")->resolve({}) == "Bob");
}

TEST_CASE("Registries: registration reports replacement", "[narrative][registry]") {
    test_helpers::QuietLogs quiet;
    PlaceholderRegistry placeholders;
    auto name = [](const std::vector<std::string>&) { return std::string("x"); };

    REQUIRE_FALSE(placeholders.register_placeholder("a", name));
    REQUIRE(placeholders.register_placeholder("a", name));
    REQUIRE(placeholders.size() == 1);
    REQUIRE(std::string(placeholders.kind()) == "Placeholder");

    ConditionRegistry conditions;
    REQUIRE_FALSE(conditions.register_condition("_a", always_true));
    REQUIRE(conditions.register_condition("_a", always_true));
}

// =============================================================================
// Actions
// =============================================================================

TEST_CASE("Registries: action entries keep their flags", "[narrative][registry]") {
    test_helpers::QuietLogs quiet;
    ActionRegistry actions;

    ActionEntry delayed;
    delayed.eventDelayed = true;
    delayed.onGameLoad = true;
    actions.register_action("travel", std::move(delayed));

    const ActionEntry* entry = actions.find("travel");
    REQUIRE(entry != nullptr);
    REQUIRE(entry->name == "travel");
    REQUIRE(entry->eventDelayed);
    REQUIRE(entry->onGameLoad);
    REQUIRE(static_cast<bool>(entry->action));  // a no-op stands in
    REQUIRE_FALSE(static_cast<bool>(entry->choiceModifier));
}

TEST_CASE("Registries: remove and names", "[narrative][registry]") {
    test_helpers::QuietLogs quiet;
    ActionRegistry actions;
    actions.register_action("music", [](const ActionPayload&) {});
    actions.register_action("flag", [](const ActionPayload&) {});

    REQUIRE(actions.names() == std::vector<std::string>{"flag", "music"});
    REQUIRE(actions.remove("music"));
    REQUIRE_FALSE(actions.remove("music"));
    REQUIRE(actions.names() == std::vector<std::string>{"flag"});
}

TEST_CASE("Registries: every engine owns its own set", "[narrative][registry]") {
    test_helpers::NarrativeFixture a;
    test_helpers::NarrativeFixture b;

    a.record_action("music");
    REQUIRE(a.engine.registries().actions.contains("music"));
    REQUIRE_FALSE(b.engine.registries().actions.contains("music"));

    // Built-ins are registered per engine
    REQUIRE(a.engine.registries().actions.contains("flag"));
    REQUIRE(b.engine.registries().placeholders.contains("flag"));
}
