#include <ckbtext/token.hpp>
#include <ckbtext/text.hpp>
#include <algorithm>

namespace ckbtext {

const char* token_type_name(TokenType t) {
    switch (t) {
    case TokenType::Word:        return "WORD";
    case TokenType::Number:      return "NUMBER";
    case TokenType::Symbol:      return "SYMBOL";
    case TokenType::Url:         return "URL";
    case TokenType::Email:       return "EMAIL";
    case TokenType::Phone:       return "PHONE";
    case TokenType::Date:        return "DATE";
    case TokenType::Time:        return "TIME";
    case TokenType::Technical:   return "TECHNICAL";
    case TokenType::Subscript:   return "SUBSCRIPT";
    case TokenType::Superscript: return "SUPERSCRIPT";
    case TokenType::Unknown:     return "UNKNOWN";
    }
    return "UNKNOWN";
}

void Token::rewrite(std::string spoken, TokenType new_type) {
    text = std::move(spoken);
    type = new_type;
    is_converted = true;
}

void compact(TokenList& tokens) {
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                [](const Token& t) { return t.is_dead(); }),
                 tokens.end());
}

const Token* token_at(const TokenList& tokens, long index) {
    if (index < 0 || index >= static_cast<long>(tokens.size())) return nullptr;
    return &tokens[static_cast<size_t>(index)];
}

Token* token_at(TokenList& tokens, long index) {
    if (index < 0 || index >= static_cast<long>(tokens.size())) return nullptr;
    return &tokens[static_cast<size_t>(index)];
}

void ensure_space_after(Token& t) {
    if (t.whitespace_after.empty()) t.whitespace_after = " ";
}

void erase_keeping_space(TokenList& tokens, size_t i) {
    Token& t = tokens[i];
    for (size_t k = i; k-- > 0;) {
        if (tokens[k].is_dead()) continue;
        if (tokens[k].whitespace_after.empty()) tokens[k].whitespace_after = t.whitespace_after;
        break;
    }
    t.erase();
}

Token* prev_live(TokenList& tokens, size_t i) {
    for (size_t k = i; k-- > 0;) {
        if (!tokens[k].is_dead()) return &tokens[k];
    }
    return nullptr;
}

bool is_numeric(const Token& t) {
    if (t.is_dead() || t.is_converted) return false;
    if (t.type == TokenType::Number) return true;
    return t.type == TokenType::Word && text::is_all_digits(t.text);
}

bool is_symbol(const Token* t, const char* s) {
    return t && !t->is_dead() && t->text == s;
}

} // namespace ckbtext
