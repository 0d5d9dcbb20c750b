#include "conditional_parser.hpp"

#include <raylib.h>

namespace storyflow::narrative {

namespace {

using Kind = ConditionalBlock::Kind;

bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           std::string_view(s).substr(s.size() - suffix.size()) == suffix;
}

// Length of the keyword that ends current (0 when there is none).
std::size_t keyword_before(const std::string& current, Kind& kind) {
    if (ends_with(current, "if")) { kind = Kind::If; return 2; }
    if (ends_with(current, "fi")) { kind = Kind::End; return 2; }
    if (ends_with(current, "else")) { kind = Kind::Else; return 4; }
    if (ends_with(current, "ifOr")) { kind = Kind::Or; return 4; }
    return 0;
}

std::size_t find_matching_brace(std::string_view text, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open; i < text.size(); ++i) {
        if (text[i] == '{') {
            ++depth;
        } else if (text[i] == '}') {
            if (--depth == 0) return i;
        }
    }
    return std::string_view::npos;
}

} // namespace

ConditionalParser::ConditionalParser(const ConditionEvaluator& evaluator)
    : evaluator_(evaluator) {}

// ============================================================================
// Tokenizer
// ============================================================================

std::vector<ConditionalBlock> ConditionalParser::tokenize(std::string_view text) {
    std::vector<ConditionalBlock> blocks;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            blocks.push_back({Kind::Literal, std::move(current)});
            current.clear();
        }
    };

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '{') {
            current += text[i++];
            continue;
        }

        const std::size_t close = find_matching_brace(text, i);
        if (close == std::string_view::npos) {
            // Left for the action pass, which reports it.
            current.append(text.substr(i));
            break;
        }

        Kind kind = Kind::Literal;
        const std::size_t keywordLen = keyword_before(current, kind);
        if (keywordLen == 0) {
            current.append(text.substr(i, close - i + 1));
            i = close + 1;
            continue;
        }

        current.erase(current.size() - keywordLen);
        flush();
        blocks.push_back({kind, std::string(trim_view(text.substr(i + 1, close - i - 1)))});
        i = close + 1;
    }

    flush();
    return blocks;
}

// ============================================================================
// Parser
// ============================================================================

std::vector<ConditionalNode> ConditionalParser::parse(const std::vector<ConditionalBlock>& blocks) {
    std::vector<ConditionalNode> nodes;

    std::size_t i = 0;
    while (i < blocks.size()) {
        const ConditionalBlock& block = blocks[i];

        if (block.kind == Kind::Literal) {
            nodes.emplace_back(block.text);
            ++i;
            continue;
        }

        if (block.kind == Kind::End) {
            TraceLog(LOG_WARNING, "[narrative] fi{} without a preceding if{} - ignored");
            ++i;
            continue;
        }

        if (block.kind == Kind::Else) {
            TraceLog(LOG_WARNING, "[narrative] else{} without a preceding if{} - treated as always true");
        }

        ConditionalChain chain;
        while (i < blocks.size()) {
            const ConditionalBlock& head = blocks[i];

            if (head.kind == Kind::End) {
                ++i;
                if (i < blocks.size() && (blocks[i].kind == Kind::If || blocks[i].kind == Kind::Or)) {
                    continue;
                }
                chain.terminated = true;
                break;
            }

            ConditionalBranch branch;
            branch.kind = head.kind;
            branch.condition = head.text;
            ++i;

            while (i < blocks.size() && blocks[i].kind == Kind::Literal) {
                branch.body += blocks[i].text;
                ++i;
            }

            chain.branches.push_back(std::move(branch));
        }

        if (!chain.terminated) {
            TraceLog(LOG_WARNING, "[narrative] if{} chain is not closed with fi{}");
        }

        nodes.emplace_back(std::move(chain));
    }

    return nodes;
}

// ============================================================================
// Evaluation
// ============================================================================

bool ConditionalParser::branch_fires(const ConditionalBranch& branch) const {
    if (branch.condition.empty()) {
        return true;
    }

    ActionMap clause;
    const std::string_view key = branch.kind == Kind::Or ? kClauseIfOr : kClauseIf;
    clause.set(std::string(key), ActionPayload::from_string(branch.condition));

    try {
        return evaluator_.perform_conditional_evaluation(clause);
    } catch (const WiringError& e) {
        TraceLog(LOG_ERROR, "[narrative] Condition \"%s\" failed: %s", branch.condition.c_str(), e.what());
        return false;
    }
}

std::string ConditionalParser::resolve(std::string_view text) const {
    if (text.find('{') == std::string_view::npos) {
        return std::string(text);
    }

    const auto blocks = tokenize(text);

    bool hasKeyword = false;
    for (const auto& block : blocks) {
        if (block.kind != Kind::Literal) {
            hasKeyword = true;
            break;
        }
    }
    if (!hasKeyword) {
        return std::string(text);
    }

    std::string output;
    for (const auto& node : parse(blocks)) {
        if (const auto* literal = std::get_if<std::string>(&node)) {
            output += *literal;
            continue;
        }

        const auto& chain = std::get<ConditionalChain>(node);
        for (const auto& branch : chain.branches) {
            if (branch_fires(branch)) {
                output += branch.body;
                break;
            }
        }
    }
    return output;
}

} // namespace storyflow::narrative
