#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace ckbtext {

enum class TokenType {
    Word,
    Number,
    Symbol,
    Url,
    Email,
    Phone,
    Date,
    Time,
    Technical,
    Subscript,
    Superscript,
    Unknown
};

const char* token_type_name(TokenType t);

// Semantic labels attached by taggers and modules
namespace tags {
inline constexpr const char* IsUnit        = "IS_UNIT";
inline constexpr const char* UnitProcessed = "UNIT_PROCESSED";
inline constexpr const char* MathTerm      = "MATH_TERM";
inline constexpr const char* MathOperator  = "MATH_OPERATOR";
inline constexpr const char* MathFunction  = "MATH_FUNCTION";
inline constexpr const char* Fraction      = "FRACTION";
inline constexpr const char* Date          = "DATE";
inline constexpr const char* Time          = "TIME";
inline constexpr const char* Phone         = "PHONE";
inline constexpr const char* Currency      = "CURRENCY";
inline constexpr const char* SpelledOut    = "IS_SPELLED_OUT";
inline constexpr const char* ScriptLatin    = "SCRIPT_LATIN";
inline constexpr const char* ScriptKurdish  = "SCRIPT_KURDISH";
inline constexpr const char* ScriptCyrillic = "SCRIPT_CYRILLIC";
inline constexpr const char* ScriptGreek    = "SCRIPT_GREEK";
inline constexpr const char* ScriptCjk      = "SCRIPT_CJK";
inline constexpr const char* ScriptOther    = "SCRIPT_OTHER";
} // namespace tags

struct Token {
    std::string text;            // current display form
    std::string original_text;   // source slice, never modified
    TokenType type = TokenType::Unknown;
    std::unordered_set<std::string> tags;
    std::string whitespace_after;
    bool is_converted = false;
    size_t offset = 0;           // byte offset of original_text in the input

    Token() = default;
    Token(std::string t, TokenType ty, std::string ws = "")
        : text(t), original_text(std::move(t)), type(ty),
          whitespace_after(std::move(ws)) {}

    bool has_tag(const std::string& tag) const { return tags.count(tag) > 0; }
    void add_tag(const std::string& tag) { tags.insert(tag); }

    // Replace the text with a spoken rendering and mark the token converted
    void rewrite(std::string spoken, TokenType new_type = TokenType::Word);

    // Tombstone: removed at the next compaction
    void erase() { text.clear(); }
    bool is_dead() const { return text.empty(); }

    bool has_space_after() const { return !whitespace_after.empty(); }
};

using TokenList = std::vector<Token>;

// Drop tombstoned tokens, preserving order
void compact(TokenList& tokens);

// Neighbour access that tolerates out-of-range indices
const Token* token_at(const TokenList& tokens, long index);
Token* token_at(TokenList& tokens, long index);

// Ensure `t` ends with whitespace (used when a neighbour becomes a phrase)
void ensure_space_after(Token& t);

// Tombstone tokens[i]; a live token glued to it inherits its whitespace
void erase_keeping_space(TokenList& tokens, size_t i);

// Nearest live token before index i
Token* prev_live(TokenList& tokens, size_t i);

// Unconverted NUMBER token, or a WORD made only of digits
bool is_numeric(const Token& t);

// Live token whose text is exactly `s`
bool is_symbol(const Token* t, const char* s);

// No whitespace between `t` and the token after it
inline bool is_tight(const Token& t) { return t.whitespace_after.empty(); }

} // namespace ckbtext
