#include "tolerant_json.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace storyflow::narrative {

namespace {

bool is_strict_json_number(std::string_view s) {
    std::size_t i = 0;
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size()) return false;

    if (s[i] == '0') {
        ++i;
    } else if (s[i] >= '1' && s[i] <= '9') {
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    } else {
        return false;
    }

    if (i < s.size() && s[i] == '.') {
        ++i;
        std::size_t frac = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++frac; }
        if (frac == 0) return false;
    }

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        std::size_t exp = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++exp; }
        if (exp == 0) return false;
    }

    return i == s.size();
}

void append_escaped(std::string& out, char c) {
    switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buf;
            } else {
                out += c;
            }
            break;
    }
}

void append_quoted(std::string& out, std::string_view raw) {
    out += '"';
    for (char c : raw) {
        append_escaped(out, c);
    }
    out += '"';
}

// Single pass rewriter: lenient input in, strict JSON text out.
class Repairer {
public:
    explicit Repairer(std::string_view in) : in_(in) {}

    std::string run() {
        skip_ws();
        if (eof()) {
            throw std::runtime_error("empty input");
        }

        parse_value(Context::TopLevel);

        skip_ws();
        if (!eof()) {
            throw std::runtime_error("unexpected character '" + std::string(1, peek()) +
                                     "' at position " + std::to_string(pos_));
        }
        return std::move(out_);
    }

private:
    enum class Context { TopLevel, Object, Array };

    bool eof() const { return pos_ >= in_.size(); }
    char peek() const { return in_[pos_]; }

    void skip_ws() {
        while (!eof()) {
            const char c = peek();
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '/' && pos_ + 1 < in_.size() && in_[pos_ + 1] == '/') {
                while (!eof() && peek() != '\n') ++pos_;
            } else if (c == '/' && pos_ + 1 < in_.size() && in_[pos_ + 1] == '*') {
                const auto end = in_.find("*/", pos_ + 2);
                pos_ = (end == std::string_view::npos) ? in_.size() : end + 2;
            } else {
                break;
            }
        }
    }

    void parse_value(Context ctx) {
        const char c = peek();
        if (c == '{') {
            parse_object();
        } else if (c == '[') {
            parse_array();
        } else if (c == '"' || c == '\'' || c == '`') {
            parse_string();
        } else {
            parse_bare(ctx);
        }
    }

    void parse_object() {
        ++pos_;  // '{'
        out_ += '{';
        bool first = true;

        while (true) {
            skip_ws();
            while (!eof() && peek() == ',') {
                ++pos_;
                skip_ws();
            }

            if (eof()) {
                out_ += '}';
                return;
            }
            if (peek() == '}') {
                ++pos_;
                out_ += '}';
                return;
            }

            if (!first) out_ += ',';
            first = false;

            parse_key();
            skip_ws();
            if (eof() || peek() != ':') {
                throw std::runtime_error("expected ':' after key at position " + std::to_string(pos_));
            }
            ++pos_;
            out_ += ':';

            skip_ws();
            if (eof() || peek() == ',' || peek() == '}') {
                out_ += "null";
            } else {
                parse_value(Context::Object);
            }
        }
    }

    void parse_array() {
        ++pos_;  // '['
        out_ += '[';
        bool first = true;

        while (true) {
            skip_ws();
            while (!eof() && peek() == ',') {
                ++pos_;
                skip_ws();
            }

            if (eof()) {
                out_ += ']';
                return;
            }
            if (peek() == ']') {
                ++pos_;
                out_ += ']';
                return;
            }

            if (!first) out_ += ',';
            first = false;

            parse_value(Context::Array);
        }
    }

    void parse_key() {
        const char c = peek();
        if (c == '"' || c == '\'' || c == '`') {
            parse_string();
            return;
        }

        const std::size_t start = pos_;
        while (!eof() && peek() != ':' && peek() != '{' && peek() != '}' &&
               peek() != '[' && peek() != ']' && peek() != ',' && peek() != '\n') {
            ++pos_;
        }

        const std::string_view key = trim_view(in_.substr(start, pos_ - start));
        if (key.empty()) {
            throw std::runtime_error("missing key at position " + std::to_string(start));
        }
        append_quoted(out_, key);
    }

    void parse_string() {
        const char quote = peek();
        ++pos_;
        out_ += '"';

        while (!eof()) {
            const char c = peek();
            if (c == quote) {
                ++pos_;
                out_ += '"';
                return;
            }

            if (c == '\\' && pos_ + 1 < in_.size()) {
                const char next = in_[pos_ + 1];
                pos_ += 2;
                switch (next) {
                    case '"': case '\\': case '/': case 'b':
                    case 'f': case 'n': case 'r': case 't': case 'u':
                        out_ += '\\';
                        out_ += next;
                        break;
                    default:
                        // \' and friends: the escaped character itself.
                        append_escaped(out_, next);
                        break;
                }
                continue;
            }

            append_escaped(out_, c);
            ++pos_;
        }

        // Unterminated string at end of input.
        out_ += '"';
    }

    void parse_bare(Context ctx) {
        const std::size_t start = pos_;
        while (!eof()) {
            const char c = peek();
            if (c == ',' || c == '\n' || c == '\r') break;
            if (ctx == Context::Object && c == '}') break;
            if (ctx == Context::Array && c == ']') break;
            if (ctx != Context::TopLevel && (c == '{' || c == '[')) break;
            ++pos_;
        }

        const std::string_view token = trim_view(in_.substr(start, pos_ - start));
        if (token.empty()) {
            throw std::runtime_error("unexpected character '" + std::string(1, peek()) +
                                     "' at position " + std::to_string(pos_));
        }

        if (token == "true" || token == "false" || token == "null") {
            out_ += token;
        } else if (token == "True") {
            out_ += "true";
        } else if (token == "False") {
            out_ += "false";
        } else if (token == "None" || token == "undefined") {
            out_ += "null";
        } else if (is_strict_json_number(token)) {
            out_ += token;
        } else {
            append_quoted(out_, token);
        }
    }

    std::string_view in_;
    std::size_t pos_{0};
    std::string out_;
};

} // namespace

std::string TolerantJson::protect_dots(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 16);

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        const bool digitFollows = i + 1 < text.size() &&
                                  std::isdigit(static_cast<unsigned char>(text[i + 1]));
        if (c == '.' && !digitFollows) {
            out += kDotToken;
        } else {
            out += c;
        }
    }
    return out;
}

std::string TolerantJson::restore_dots(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto hit = text.find(kDotToken, pos);
        if (hit == std::string_view::npos) {
            out += text.substr(pos);
            break;
        }
        out += text.substr(pos, hit - pos);
        out += '.';
        pos = hit + kDotToken.size();
    }
    return out;
}

std::string TolerantJson::repair(std::string_view text) {
    const std::string protectedText = protect_dots(text);
    Repairer repairer(protectedText);
    return restore_dots(repairer.run());
}

JsonParseResult TolerantJson::parse(std::string_view text) {
    std::string repaired;
    try {
        repaired = repair(text);
    } catch (const std::runtime_error& e) {
        return JsonParseResult::fail(std::string("repair failed: ") + e.what());
    }

    try {
        return JsonParseResult::ok(Json::parse(repaired));
    } catch (const Json::exception& e) {
        return JsonParseResult::fail(std::string("parse failed: ") + e.what());
    }
}

} // namespace storyflow::narrative
