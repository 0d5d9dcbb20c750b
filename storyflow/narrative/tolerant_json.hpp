#pragma once

#include "narrative_types.hpp"

#include <string>
#include <string_view>

namespace storyflow::narrative {

struct JsonParseResult {
    bool success{false};
    Json value;
    std::string error;

    static JsonParseResult ok(Json v) { return {true, std::move(v), ""}; }
    static JsonParseResult fail(const std::string& err) { return {false, Json(), err}; }

    explicit operator bool() const { return success; }
};

// Parser for the near-JSON authors type into text and choice params:
//   {music: theme1, "flag": 'gold>5', enter: crypt.hall,}
// Unquoted keys and values, single quotes, trailing or missing commas,
// comments and unclosed containers at end of input are repaired before the
// strict parse.
class TolerantJson {
public:
    // Repaired, strictly valid JSON text. Throws std::runtime_error when the
    // input cannot be repaired.
    static std::string repair(std::string_view text);

    static JsonParseResult parse(std::string_view text);

    // Token a literal '.' (one not followed by a digit) is swapped for while
    // repairing, so dotted paths survive as single bare words.
    static constexpr std::string_view kDotToken = "__dot__";

    static std::string protect_dots(std::string_view text);
    static std::string restore_dots(std::string_view text);
};

} // namespace storyflow::narrative
