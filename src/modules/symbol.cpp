#include <ckbtext/modules/symbol.hpp>
#include <ckbtext/text.hpp>
#include <unordered_set>

namespace ckbtext {

namespace {

bool is_sentence_punct(const std::string& s) {
    static const std::unordered_set<std::string> punct = {
        ".", "!", "?", ",", ";", ":", "،", "؟", "؛", "…"
    };
    return punct.count(s) > 0;
}

bool is_decoration(const std::string& s, bool pause_markers) {
    static const std::unordered_set<std::string> decorations = {
        "(", ")", "[", "]", "{", "}", "\"", "'", "“", "”", "‘", "’",
        "«", "»", "*", "~", "`", "^", "_", "\\", "•", "<", ">"
    };
    if (s == "|") return !pause_markers;
    return decorations.count(s) > 0;
}

// Number spoken by an earlier pass
bool was_number(const Token* t) {
    if (!t || t->is_dead()) return false;
    if (t->type == TokenType::Number) return true;
    return t->is_converted && text::has_digit(t->original_text);
}

} // anonymous namespace

void SymbolModule::process(TokenList& tokens) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || t.is_converted || t.type != TokenType::Symbol) continue;
        Token* prev = prev_live(tokens, i);
        Token* next = token_at(tokens, static_cast<long>(i) + 1);

        // "!!!" -> "!"
        if (is_sentence_punct(t.text)) {
            if (prev && prev->text == t.text && is_tight(*prev) &&
                prev->type == TokenType::Symbol) {
                prev->whitespace_after = t.whitespace_after;
                t.erase();
            }
            continue;
        }

        if (t.text == "&") {
            t.rewrite("و");
        } else if (t.text == "%" && was_number(prev)) {
            t.rewrite("لە سەدا");
        } else if (t.text == "°") {
            if (next && is_tight(t) && (next->text == "C" || next->text == "c")) {
                t.rewrite("پلەی سەدی");
                t.whitespace_after = next->whitespace_after;
                next->erase();
            } else if (next && is_tight(t) && (next->text == "F" || next->text == "f")) {
                t.rewrite("پلەی فەھرەنھایت");
                t.whitespace_after = next->whitespace_after;
                next->erase();
            } else {
                t.rewrite("پلە");
            }
        } else if (t.text == "#") {
            t.rewrite("ھاشتاگ");
        } else if (is_decoration(t.text, config().pause_markers)) {
            erase_keeping_space(tokens, i);
        }
    }
}

} // namespace ckbtext
