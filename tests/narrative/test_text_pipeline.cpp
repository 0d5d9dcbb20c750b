/**
 * @file test_text_pipeline.cpp
 * @brief Tests for resolve_string: every pass and how they combine.
 */

#include <catch2/catch_test_macros.hpp>

#include "narrative_fixture.hpp"

#include <stdexcept>

using namespace storyflow::narrative;
using test_helpers::NarrativeFixture;

using Calls = std::vector<std::string>;

// =============================================================================
// Scenarios
// =============================================================================

TEST_CASE("Pipeline: placeholder substitution", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.constant_placeholder("name", "World");

    auto result = fx.engine.resolve_string("Hello |name|!");
    REQUIRE(result.output == "Hello World!");
    REQUIRE(result.actions.empty());
}

TEST_CASE("Pipeline: inline branch on a flag", "[narrative][pipeline]") {
    NarrativeFixture fx;

    fx.host.set_flag("gold", 20);
    REQUIRE(fx.engine.resolve_string("if{gold>10}Rich!else{}Poor.fi{}").output == "Rich!");

    fx.host.set_flag("gold", 5);
    REQUIRE(fx.engine.resolve_string("if{gold>10}Rich!else{}Poor.fi{}").output == "Poor.");
}

TEST_CASE("Pipeline: immediate action", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.record_action("music");

    auto result = fx.engine.resolve_string(R"({"music": "theme1"}Hello)");

    REQUIRE(fx.calls == Calls{"music:theme1"});
    REQUIRE(result.output == "Hello");
    REQUIRE(result.actions.size() == 1);
    REQUIRE(result.actions.find("music")->as_string() == "theme1");
}

TEST_CASE("Pipeline: delayed action is collected, not run", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.record_action("travel", true);

    auto result = fx.engine.resolve_string("{travel: chapel}You leave.");

    REQUIRE(fx.calls.empty());
    REQUIRE(result.actions.contains("travel"));

    auto delayed = fx.engine.get_delayed_actions(result.actions);
    REQUIRE(delayed.size() == 1);
    REQUIRE(delayed.find("travel")->as_string() == "chapel");
}

// =============================================================================
// Placeholders
// =============================================================================

TEST_CASE("Pipeline: placeholder arguments", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.engine.register_placeholder("pair", [](const std::vector<std::string>& args) {
        return args.size() == 2 ? args[0] + "&" + args[1] : std::string("?");
    });

    REQUIRE(fx.engine.resolve_string("|pair(Ann, Bob)|").output == "Ann&Bob");
    REQUIRE(fx.engine.resolve_string("|pair()|").output == "?");
}

TEST_CASE("Pipeline: unresolvable placeholders stay literal", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.engine.register_placeholder("broken", [](const std::vector<std::string>&) -> std::string {
        throw std::runtime_error("no data");
    });

    REQUIRE(fx.engine.resolve_string("a |nope| b").output == "a |nope| b");
    REQUIRE(fx.engine.resolve_string("a |broken| b").output == "a |broken| b");
    REQUIRE(fx.engine.resolve_string("a |bad name| b").output == "a |bad name| b");
    REQUIRE(fx.engine.resolve_string("a || b |").output == "a || b |");
}

TEST_CASE("Pipeline: placeholders feed conditions", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.constant_placeholder("limit", "10");
    fx.host.set_flag("gold", 12);

    REQUIRE(fx.engine.resolve_string("if{gold>|limit|}rich fi{}").output == "rich ");
}

// =============================================================================
// Templates
// =============================================================================

TEST_CASE("Pipeline: templates resolve recursively", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.constant_placeholder("name", "World");
    fx.host.add_template("crypt", "$intro", "Welcome, |name|. |$mood|");
    fx.host.add_template("crypt", "$mood", "It is cold.");
    fx.host.add_template("chapel", "$bell", "A bell rings.");

    REQUIRE(fx.engine.resolve_string("|$intro|").output == "Welcome, World. It is cold.");
    REQUIRE(fx.engine.resolve_string("|$chapel.bell|").output == "A bell rings.");
    REQUIRE(fx.engine.resolve_string("|$missing| end").output == "|$missing| end");
}

TEST_CASE("Pipeline: template actions merge into the result", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.record_action("sfx");
    fx.record_action("music");
    fx.host.add_template("crypt", "$door", "{sfx: creak}The door opens.");

    SECTION("executed once") {
        auto result = fx.engine.resolve_string("{music: low}|$door|");
        REQUIRE(result.output == "The door opens.");
        REQUIRE(result.actions.keys() == std::vector<std::string>{"sfx", "music"});
        REQUIRE(fx.calls == Calls{"sfx:creak", "music:low"});
    }

    SECTION("no-execute reaches templates") {
        auto result = fx.engine.resolve_string("|$door|", true);
        REQUIRE(result.actions.contains("sfx"));
        REQUIRE(fx.calls.empty());
    }
}

TEST_CASE("Pipeline: self-referencing template stops at the depth limit", "[narrative][pipeline]") {
    storyflow::core::NarrativeConfig config;
    config.max_resolve_depth = 3;
    NarrativeFixture fx(config);
    fx.host.add_template("crypt", "$loop", "again |$loop|");

    ResolveResult result;
    REQUIRE_NOTHROW(result = fx.engine.resolve_string("|$loop|"));
    REQUIRE(result.output == "again again again |$loop|");
    REQUIRE(fx.engine.pipeline().depth() == 0);
}

// =============================================================================
// Markup passes
// =============================================================================

TEST_CASE("Pipeline: code spans are escaped", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.constant_placeholder("x", "X");

    auto result = fx.engine.resolve_string("[code]|x| {a} *b*[/code] |x|");
    REQUIRE(result.output ==
            "<span class=\"output_code\">&#124;x&#124; &#123;a&#125; &#42;b&#42;</span> X");
    REQUIRE(result.actions.empty());
}

TEST_CASE("Pipeline: code class comes from the config", "[narrative][pipeline]") {
    storyflow::core::NarrativeConfig config;
    config.code_class = "mono";
    NarrativeFixture fx(config);

    REQUIRE(fx.engine.resolve_string("[code]a<b[/code]").output == "<span class=\"mono\">a&lt;b</span>");
    REQUIRE(fx.engine.resolve_string("[code]open").output == "[code]open");
}

TEST_CASE("Pipeline: speaker prefix", "[narrative][pipeline]") {
    NarrativeFixture fx;

    REQUIRE(fx.engine.resolve_string("Alice: Hi there").output == "Hi there");
    REQUIRE(fx.host.talking_character() == std::optional<std::string>("Alice"));

    REQUIRE(fx.engine.resolve_string("Just narration.").output == "Just narration.");
    REQUIRE_FALSE(fx.host.talking_character().has_value());

    // Multi-line remainders are not dialogue
    REQUIRE(fx.engine.resolve_string("Note: one\ntwo").output == "Note: one\ntwo");
    REQUIRE_FALSE(fx.host.talking_character().has_value());
}

TEST_CASE("Pipeline: speaker is read after actions are removed", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.record_action("music");

    REQUIRE(fx.engine.resolve_string("{music: x}Bob: Hey").output == "Hey");
    REQUIRE(fx.host.talking_character() == std::optional<std::string>("Bob"));
}

TEST_CASE("Pipeline: style markup", "[narrative][pipeline]") {
    NarrativeFixture fx;

    REQUIRE(fx.engine.resolve_string("**a** *b*").output == "<i>a</i> <b>b</b>");
    REQUIRE(TextPipeline::resolve_styles("a * b") == "a * b");
    REQUIRE(TextPipeline::resolve_styles("*x\ny*") == "*x\ny*");
}

// =============================================================================
// Robustness
// =============================================================================

TEST_CASE("Pipeline: unmatched brace never throws", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.record_action("music");

    ResolveResult result;
    REQUIRE_NOTHROW(result = fx.engine.resolve_string("Hello {music: x}there {oops"));
    REQUIRE(result.output == "Hello there {oops");
    REQUIRE(fx.calls == Calls{"music:x"});
}

TEST_CASE("Pipeline: redirect short-circuits the fragment", "[narrative][pipeline]") {
    NarrativeFixture fx;

    auto result = fx.engine.resolve_string("Alice: Hi {redirect: crypt.hall}");
    REQUIRE(result.redirected);
    REQUIRE(result.output.empty());
    REQUIRE(result.actions.find("redirect")->as_string() == "crypt.hall");
}

TEST_CASE("Pipeline: redirect inside a template short-circuits the caller", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.record_action("sfx");
    fx.host.add_template("crypt", "$door", "{sfx: creak}Opened.");
    fx.host.add_template("crypt", "$trap", "{redirect: hall}ignored");

    auto result = fx.engine.resolve_string("before |$door| |$trap| |$door| {sfx: outer}after");

    REQUIRE(result.redirected);
    REQUIRE(result.output.empty());
    REQUIRE(result.actions.size() == 1);
    REQUIRE(result.actions.find("redirect")->as_string() == "hall");

    // Only the template resolved before the redirect ran its actions
    REQUIRE(fx.calls == Calls{"sfx:creak"});
}

TEST_CASE("Pipeline: static text resolves identically twice", "[narrative][pipeline]") {
    NarrativeFixture fx;
    fx.constant_placeholder("name", "World");
    fx.host.set_flag("gold", 3);

    const std::string text = "Guard: **Halt**, |name|! if{gold>1}Pay up.else{}Move on.fi{} [code]x|y[/code]";
    const auto first = fx.engine.resolve_string(text);
    const auto second = fx.engine.resolve_string(text);

    REQUIRE(first.output == second.output);
    REQUIRE(first.actions == second.actions);
}
