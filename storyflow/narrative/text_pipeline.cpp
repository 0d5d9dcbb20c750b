#include "text_pipeline.hpp"

#include <cctype>
#include <exception>

#include <raylib.h>

namespace storyflow::narrative {

namespace {

constexpr std::string_view kCodeOpen = "[code]";
constexpr std::string_view kCodeClose = "[/code]";

void append_code_escaped(std::string& out, std::string_view code) {
    for (char c : code) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '{': out += "&#123;"; break;
            case '}': out += "&#125;"; break;
            case '[': out += "&#91;"; break;
            case ']': out += "&#93;"; break;
            case '|': out += "&#124;"; break;
            case '*': out += "&#42;"; break;
            case '$': out += "&#36;"; break;
            default: out += c; break;
        }
    }
}

// Walks |...| spans (non-empty, no '|' inside) left to right. replace() gets
// the inner text and returns the substitution, or nullopt to keep the span.
template <typename Fn>
std::string replace_pipe_spans(std::string_view text, bool templatesOnly, Fn&& replace) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '|') {
            out += text[i++];
            continue;
        }

        const bool startsTemplate = i + 1 < text.size() && text[i + 1] == '$';
        const std::size_t close = text.find('|', i + 1);
        if (close == std::string_view::npos || close == i + 1 || (templatesOnly && !startsTemplate)) {
            out += text[i++];
            continue;
        }

        const std::string_view inner = text.substr(i + 1, close - i - 1);
        if (auto value = replace(inner)) {
            out += *value;
        } else {
            out.append(text.substr(i, close - i + 1));
        }
        i = close + 1;
    }
    return out;
}

// Non-greedy delim...delim on one line, as the markup authors use it.
std::string replace_delimited(std::string_view text, std::string_view delim,
                              std::string_view open, std::string_view close) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text.substr(i, delim.size()) != delim) {
            out += text[i++];
            continue;
        }

        const std::size_t start = i + delim.size();
        const std::size_t end = text.find(delim, start);
        const std::string_view inner = end == std::string_view::npos
            ? std::string_view{}
            : text.substr(start, end - start);

        if (end == std::string_view::npos || inner.find_first_of("\r\n") != std::string_view::npos) {
            out += text[i++];
            continue;
        }

        out += open;
        out += inner;
        out += close;
        i = end + delim.size();
    }
    return out;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_valid_placeholder(std::string_view name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!is_word_char(c)) return false;
    }
    return true;
}

// Decrements the nesting counter on every exit path.
class DepthGuard {
public:
    explicit DepthGuard(int& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& depth_;
};

} // namespace

TextPipeline::TextPipeline(const Registries& registries, INarrativeHost& host,
                           const ConditionEvaluator& evaluator, const ActionResolver& actions,
                           const core::NarrativeConfig& config)
    : registries_(registries)
    , host_(host)
    , actions_(actions)
    , conditionals_(evaluator)
    , config_(config) {}

ResolveResult TextPipeline::resolve_string(std::string_view text, bool noExecuteActions) {
    if (depth_ >= config_.max_resolve_depth) {
        TraceLog(LOG_ERROR, "[narrative] Resolve depth %d exceeded, fragment left unresolved: %.*s",
                 config_.max_resolve_depth, static_cast<int>(text.size()), text.data());
        return {std::string(text), ActionMap{}, false};
    }
    DepthGuard guard(depth_);

    ResolveResult result;

    std::string output = resolve_code(text);
    output = resolve_placeholders(output);
    output = resolve_conditionals(output);
    output = resolve_templates(output, noExecuteActions, result);
    if (result.redirected) {
        return result;
    }

    ExtractionResult extracted = actions_.extract_actions(output, noExecuteActions);
    if (extracted.redirected) {
        result.actions = std::move(extracted.actions);
        result.redirected = true;
        return result;
    }
    result.actions.merge(extracted.actions);

    output = resolve_speaker(extracted.output);
    result.output = resolve_styles(output);
    return result;
}

// ============================================================================
// Passes
// ============================================================================

std::string TextPipeline::resolve_code(std::string_view text) const {
    std::string out;
    std::size_t pos = 0;

    while (pos < text.size()) {
        const auto open = text.find(kCodeOpen, pos);
        if (open == std::string_view::npos) break;

        const auto close = text.find(kCodeClose, open + kCodeOpen.size());
        if (close == std::string_view::npos) break;

        out.append(text.substr(pos, open - pos));
        out += "<span class=\"";
        out += config_.code_class;
        out += "\">";
        append_code_escaped(out, text.substr(open + kCodeOpen.size(), close - open - kCodeOpen.size()));
        out += "</span>";

        pos = close + kCodeClose.size();
    }

    out.append(text.substr(pos));
    return out;
}

std::optional<std::string> TextPipeline::resolve_placeholder(std::string_view reference) const {
    std::string_view name = reference;
    std::string_view args;

    const auto paren = reference.find('(');
    if (paren != std::string_view::npos) {
        name = reference.substr(0, paren);
        const auto close = reference.find(')', paren + 1);
        if (close != reference.size() - 1) {
            TraceLog(LOG_ERROR, "[narrative] Invalid placeholder format: %.*s",
                     static_cast<int>(reference.size()), reference.data());
            return std::nullopt;
        }
        args = reference.substr(paren + 1, close - paren - 1);
    }

    if (!is_valid_placeholder(name)) {
        TraceLog(LOG_ERROR, "[narrative] Invalid placeholder format: %.*s",
                 static_cast<int>(reference.size()), reference.data());
        return std::nullopt;
    }

    const PlaceholderEntry* entry = registries_.placeholders.find(name);
    if (!entry || !entry->resolve) {
        TraceLog(LOG_ERROR, "[narrative] Placeholder %.*s is not registered.",
                 static_cast<int>(name.size()), name.data());
        return std::nullopt;
    }

    try {
        const PlaceholderFn resolve = entry->resolve;
        return resolve(ConditionEvaluator::split_args(args));
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "[narrative] Error resolving placeholder \"%.*s\": %s",
                 static_cast<int>(reference.size()), reference.data(), e.what());
        return std::nullopt;
    }
}

std::string TextPipeline::resolve_placeholders(std::string_view text) const {
    return replace_pipe_spans(text, false, [this](std::string_view inner) -> std::optional<std::string> {
        if (inner.front() == '$') {
            return std::nullopt;
        }
        return resolve_placeholder(inner);
    });
}

std::string TextPipeline::resolve_conditionals(std::string_view text) const {
    return conditionals_.resolve(text);
}

std::optional<std::string> TextPipeline::resolve_template(std::string_view reference, bool noExecuteActions,
                                                          ResolveResult& result) {
    // Templates after a redirect are never resolved.
    if (result.redirected) {
        return std::string();
    }

    std::string container;
    std::string templateId(reference);

    const auto dot = reference.find(kPathSeparator);
    if (dot != std::string_view::npos) {
        container = std::string(reference.substr(1, dot - 1));
        const auto next = reference.find(kPathSeparator, dot + 1);
        templateId = "$" + std::string(reference.substr(dot + 1, next == std::string_view::npos
                                                                      ? std::string_view::npos
                                                                      : next - dot - 1));
    }

    auto content = host_.find_template(container, templateId);
    if (!content) {
        TraceLog(LOG_ERROR, "[narrative] Error resolving template \"%.*s\": no line %s in container \"%s\"",
                 static_cast<int>(reference.size()), reference.data(), templateId.c_str(),
                 container.empty() ? host_.active_container().c_str() : container.c_str());
        return std::nullopt;
    }

    ResolveResult nested = resolve_string(*content, noExecuteActions);
    if (nested.redirected) {
        result.actions = std::move(nested.actions);
        result.redirected = true;
        return std::string();
    }

    result.actions.merge(nested.actions);
    return std::move(nested.output);
}

std::string TextPipeline::resolve_templates(std::string_view text, bool noExecuteActions, ResolveResult& result) {
    return replace_pipe_spans(text, true, [&](std::string_view inner) {
        return resolve_template(inner, noExecuteActions, result);
    });
}

std::string TextPipeline::resolve_speaker(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size() && is_word_char(text[i])) ++i;

    if (i > 0 && i < text.size() && text[i] == ':') {
        std::size_t rest = i + 1;
        while (rest < text.size() && std::isspace(static_cast<unsigned char>(text[rest]))) ++rest;

        const std::string_view line = text.substr(rest);
        if (line.find_first_of("\r\n") == std::string_view::npos) {
            host_.set_talking_character(std::string(text.substr(0, i)));
            return std::string(line);
        }
    }

    host_.set_talking_character(std::nullopt);
    return std::string(text);
}

std::string TextPipeline::resolve_styles(std::string_view text) {
    const std::string italic = replace_delimited(text, "**", "<i>", "</i>");
    return replace_delimited(italic, "*", "<b>", "</b>");
}

} // namespace storyflow::narrative
