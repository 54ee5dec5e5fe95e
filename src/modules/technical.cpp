#include <ckbtext/modules/technical.hpp>
#include <ckbtext/text.hpp>
#include <ckbtext/transliterate.hpp>
#include <unordered_set>

namespace ckbtext {

namespace {

const char* const kHashtag = "ھاشتاگ";
const char* const kAt = "ئەت";
const char* const kDash = "داش";

bool is_reserved(const std::string& word) {
    static const std::unordered_set<std::string> math_terms = {
        "ln", "log", "sin", "cos", "tan", "lim", "mod", "exp"
    };
    static const std::unordered_set<std::string> currency_codes = {
        "IQD", "USD", "EUR", "GBP", "JPY", "AED", "TRY", "IRR", "KWD",
        "SAR", "AUD", "CAD"
    };
    static const std::unordered_set<std::string> unit_codes = {
        "mg", "ml", "gb", "mb", "kb", "tb", "km", "kg", "cm", "mm",
        "ft", "yd", "mi", "in", "oz", "lb", "gal", "mph", "ms",
        "kwh", "mw", "hp", "kpa", "psi", "kn", "cal", "kcal"
    };
    std::string lower = text::to_lower(word);
    return math_terms.count(lower) || unit_codes.count(lower) ||
           currency_codes.count(text::to_upper(word));
}

bool is_hex(const std::string& word) {
    if (word.empty()) return false;
    for (char c : word) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
                   (c >= 'A' && c <= 'F');
        if (!hex) return false;
    }
    return true;
}

bool is_potential_code(const Token& t) {
    if (t.is_dead() || t.is_converted) return false;
    if (t.type == TokenType::Number) return true;
    if (t.type != TokenType::Word || is_reserved(t.text)) return false;
    return TechnicalModule::is_code(t.text) || is_hex(t.text);
}

} // anonymous namespace

bool TechnicalModule::is_code(const std::string& word) {
    if (is_reserved(word)) return false;
    bool letter = false;
    bool digit = false;
    bool joiner = false;
    for (UChar32 c : text::decode(word)) {
        if (text::is_digit(c)) digit = true;
        else if (text::is_letter(c)) letter = true;
        else if (c == '_' || c == '-') joiner = true;
    }
    return letter && (digit || joiner);
}

void TechnicalModule::process(TokenList& tokens) const {
    // Tight code-dash-code pairs ("A-1", "x86-64b")
    std::unordered_set<size_t> bound;
    for (size_t i = 1; i + 1 < tokens.size(); ++i) {
        const Token& dash = tokens[i];
        if (dash.is_converted || dash.text != "-") continue;
        const Token& prev = tokens[i - 1];
        const Token& next = tokens[i + 1];
        if (!is_tight(prev) || !is_tight(dash)) continue;
        if (!is_potential_code(prev) || !is_potential_code(next)) continue;
        if (prev.type == TokenType::Number && next.type == TokenType::Number) continue;
        bound.insert(i - 1);
        bound.insert(i);
        bound.insert(i + 1);
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || t.is_converted) continue;

        if (t.type == TokenType::Technical) {
            const char* lead = t.text[0] == '#' ? kHashtag : kAt;
            std::string core = spell_out(t.text.substr(1));
            t.rewrite(core.empty() ? std::string(lead) : std::string(lead) + " " + core);
            t.add_tag(tags::SpelledOut);
            continue;
        }

        if (bound.count(i)) {
            if (t.text == "-") {
                t.rewrite(kDash);
                ensure_space_after(t);
            } else {
                t.rewrite(spell_out(t.text));
                t.add_tag(tags::SpelledOut);
            }
            continue;
        }

        if (t.type == TokenType::Word && is_code(t.text)) {
            t.rewrite(spell_out(t.text));
            t.add_tag(tags::SpelledOut);
        }
    }
}

} // namespace ckbtext
