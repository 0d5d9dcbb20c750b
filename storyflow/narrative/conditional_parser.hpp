#pragma once

#include "condition_evaluator.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace storyflow::narrative {

// ============================================================================
// Tokens and tree of the inline if{}/ifOr{}/else{}/fi{} syntax
// ============================================================================

struct ConditionalBlock {
    enum class Kind : std::uint8_t {
        Literal = 0,
        If,
        Or,
        Else,
        End,
    };

    Kind kind{Kind::Literal};
    std::string text;   // literal text, or the condition of If/Or/Else
};

struct ConditionalBranch {
    ConditionalBlock::Kind kind{ConditionalBlock::Kind::If};
    std::string condition;
    std::string body;
};

// Branches up to fi{}; at most one of them fires.
struct ConditionalChain {
    std::vector<ConditionalBranch> branches;
    bool terminated{false};
};

using ConditionalNode = std::variant<std::string, ConditionalChain>;

// ============================================================================
// ConditionalParser
// ============================================================================

class ConditionalParser {
public:
    explicit ConditionalParser(const ConditionEvaluator& evaluator);

    /// Text with every chain replaced by the body of its firing branch.
    std::string resolve(std::string_view text) const;

    /// Keywords are the characters directly before a '{': "if", "fi",
    /// "else", "ifOr". Any other brace group is literal text.
    static std::vector<ConditionalBlock> tokenize(std::string_view text);

    /// Groups tokens into literals and chains. A fi{} directly followed by
    /// if{} or ifOr{} continues the same chain.
    static std::vector<ConditionalNode> parse(const std::vector<ConditionalBlock>& blocks);

private:
    bool branch_fires(const ConditionalBranch& branch) const;

    const ConditionEvaluator& evaluator_;
};

} // namespace storyflow::narrative
