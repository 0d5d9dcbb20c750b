/**
 * @file test_conditional_parser.cpp
 * @brief Unit tests for the inline if{}/ifOr{}/else{}/fi{} syntax.
 */

#include <catch2/catch_test_macros.hpp>

#include <storyflow/narrative/conditional_parser.hpp>

#include "narrative_fixture.hpp"

using namespace storyflow::narrative;
using test_helpers::NarrativeFixture;

using Kind = ConditionalBlock::Kind;

namespace {

std::vector<Kind> kinds(const std::vector<ConditionalBlock>& blocks) {
    std::vector<Kind> out;
    for (const auto& block : blocks) {
        out.push_back(block.kind);
    }
    return out;
}

} // namespace

// =============================================================================
// Tokenizer
// =============================================================================

TEST_CASE("Conditionals: tokenizer finds keywords before braces", "[narrative][conditionals]") {
    auto blocks = ConditionalParser::tokenize("a if{x=1}b else{}c fi{} d");

    REQUIRE(kinds(blocks) == std::vector<Kind>{
        Kind::Literal, Kind::If, Kind::Literal, Kind::Else, Kind::Literal, Kind::End, Kind::Literal});
    REQUIRE(blocks[0].text == "a ");
    REQUIRE(blocks[1].text == "x=1");
    REQUIRE(blocks[2].text == "b ");
    REQUIRE(blocks[3].text.empty());
    REQUIRE(blocks[6].text == " d");
}

TEST_CASE("Conditionals: tokenizer knows ifOr", "[narrative][conditionals]") {
    auto blocks = ConditionalParser::tokenize("ifOr{a=1, b=1}yes");
    REQUIRE(kinds(blocks) == std::vector<Kind>{Kind::Or, Kind::Literal});
    REQUIRE(blocks[0].text == "a=1, b=1");
}

TEST_CASE("Conditionals: other brace groups stay literal", "[narrative][conditionals]") {
    auto blocks = ConditionalParser::tokenize("say {music: x} now");
    REQUIRE(blocks.size() == 1);
    REQUIRE(blocks[0].kind == Kind::Literal);
    REQUIRE(blocks[0].text == "say {music: x} now");
}

// =============================================================================
// Parser
// =============================================================================

TEST_CASE("Conditionals: fi{} followed by if{} continues the chain", "[narrative][conditionals]") {
    auto joined = ConditionalParser::parse(ConditionalParser::tokenize("if{a=1}A fi{}if{b=1}B fi{}"));
    REQUIRE(joined.size() == 1);
    const auto& chain = std::get<ConditionalChain>(joined[0]);
    REQUIRE(chain.branches.size() == 2);
    REQUIRE(chain.terminated);

    auto separate = ConditionalParser::parse(ConditionalParser::tokenize("if{a=1}A fi{} if{b=1}B fi{}"));
    REQUIRE(separate.size() == 3);
    REQUIRE(std::holds_alternative<ConditionalChain>(separate[0]));
    REQUIRE(std::get<std::string>(separate[1]) == " ");
    REQUIRE(std::holds_alternative<ConditionalChain>(separate[2]));
}

TEST_CASE("Conditionals: unterminated chain is kept open", "[narrative][conditionals]") {
    auto nodes = ConditionalParser::parse(ConditionalParser::tokenize("if{a=1}A"));
    REQUIRE(nodes.size() == 1);
    REQUIRE_FALSE(std::get<ConditionalChain>(nodes[0]).terminated);
}

// =============================================================================
// Evaluation
// =============================================================================

TEST_CASE("Conditionals: if/else picks one branch", "[narrative][conditionals]") {
    NarrativeFixture fx;
    ConditionalParser parser(fx.engine.evaluator());

    fx.host.set_flag("gold", 20);
    REQUIRE(parser.resolve("if{gold>10}Rich!else{}Poor.fi{}") == "Rich!");

    fx.host.set_flag("gold", 5);
    REQUIRE(parser.resolve("if{gold>10}Rich!else{}Poor.fi{}") == "Poor.");
}

TEST_CASE("Conditionals: surrounding text is kept", "[narrative][conditionals]") {
    NarrativeFixture fx;
    ConditionalParser parser(fx.engine.evaluator());
    fx.host.set_flag("torch", 1);

    REQUIRE(parser.resolve("The room is if{torch=1}lit.fi{} You wait.") == "The room is lit. You wait.");
    REQUIRE(parser.resolve("No branches here.") == "No branches here.");
    REQUIRE(parser.resolve("{music: x}Hi") == "{music: x}Hi");
}

TEST_CASE("Conditionals: ifOr reads the OR clause", "[narrative][conditionals]") {
    NarrativeFixture fx;
    ConditionalParser parser(fx.engine.evaluator());

    REQUIRE(parser.resolve("ifOr{key=1, lockpick=1}open fi{}").empty());

    fx.host.set_flag("lockpick", 1);
    REQUIRE(parser.resolve("ifOr{key=1, lockpick=1}open fi{}") == "open ");
    REQUIRE(parser.resolve("if{key=1, lockpick=1}both fi{}").empty());
}

TEST_CASE("Conditionals: first firing branch wins", "[narrative][conditionals]") {
    NarrativeFixture fx;
    ConditionalParser parser(fx.engine.evaluator());
    fx.host.set_flag("hp", 50);

    const std::string text = "if{hp>80}fine else{hp>30}hurt else{}dying fi{}";
    REQUIRE(parser.resolve(text) == "hurt ");

    fx.host.set_flag("hp", 10);
    REQUIRE(parser.resolve(text) == "dying ");
}

TEST_CASE("Conditionals: continued chain fires once", "[narrative][conditionals]") {
    NarrativeFixture fx;
    ConditionalParser parser(fx.engine.evaluator());
    fx.host.set_flag("a", 1);
    fx.host.set_flag("b", 1);

    REQUIRE(parser.resolve("if{a=1}A fi{}if{b=1}B fi{}") == "A ");
    REQUIRE(parser.resolve("if{a=1}A fi{} if{b=1}B fi{}") == "A  B ");
}

TEST_CASE("Conditionals: action objects inside a body", "[narrative][conditionals]") {
    NarrativeFixture fx;
    ConditionalParser parser(fx.engine.evaluator());
    fx.host.set_flag("gold", 3);

    REQUIRE(parser.resolve("if{gold>1}{music: coins}Paid.else{}Broke.fi{}") == "{music: coins}Paid.");
}

TEST_CASE("Conditionals: odd input has safe defaults", "[narrative][conditionals]") {
    NarrativeFixture fx;
    ConditionalParser parser(fx.engine.evaluator());

    SECTION("stray else{} always fires") {
        REQUIRE(parser.resolve("else{}always") == "always");
    }

    SECTION("stray fi{} is ignored") {
        REQUIRE(parser.resolve("text fi{}more") == "text more");
    }

    SECTION("second else{} never fires") {
        REQUIRE(parser.resolve("if{gold>100}A else{}B else{}C fi{}") == "B ");
    }

    SECTION("unterminated chain still resolves") {
        fx.host.set_flag("gold", 5);
        REQUIRE(parser.resolve("if{gold>1}rich") == "rich");
        fx.host.set_flag("gold", 0);
        REQUIRE(parser.resolve("if{gold>1}rich").empty());
    }

    SECTION("unknown condition makes the branch false") {
        REQUIRE(parser.resolve("if{_nope=1}A else{}B fi{}") == "B");
    }

    SECTION("unmatched brace is left for the action pass") {
        REQUIRE(parser.resolve("if{gold=0}ok fi{} {broken") == "ok  {broken");
    }
}
