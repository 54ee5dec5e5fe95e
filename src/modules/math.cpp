#include <ckbtext/modules/math.hpp>
#include <ckbtext/lexicon.hpp>
#include <ckbtext/numbers.hpp>
#include <ckbtext/text.hpp>
#include <ckbtext/transliterate.hpp>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace ckbtext {

namespace {

const std::unordered_map<std::string, std::string>& operator_words() {
    static const std::unordered_map<std::string, std::string> words = {
        {"+", "کۆ"},
        {"*", "کەڕەتی"},
        {"×", "کەڕەتی"},
        {"/", "دابەش"},
        {"÷", "دابەش"},
        {"±", "کەم کۆ"},
        {"√", "ڕەگی دووجای"},
        {"-", "کەم"},
        {"−", "کەم"},
        {"=", "یەکسانە بە"},
        {"^", "توان"},
        {"%", "لە سەدا"},
        {"≈", "نزیکەی"},
    };
    return words;
}

const std::unordered_map<std::string, std::string>& function_words() {
    static const std::unordered_map<std::string, std::string> words = {
        {"ln", "لۆگاریتمی سروشتی"},
        {"log", "لۆگاریتمی"},
        {"sin", "ساینی"},
        {"cos", "کۆساینی"},
        {"tan", "تانجێنتی"},
        {"lim", "لیمێتی"},
        {"mod", "مۆد"},
        {"exp", "ئێکسپۆنێنشیاڵ"},
    };
    return words;
}

const std::unordered_map<std::string, std::pair<int, int>>& unicode_fractions() {
    static const std::unordered_map<std::string, std::pair<int, int>> table = {
        {"½", {1, 2}}, {"¼", {1, 4}}, {"¾", {3, 4}},
        {"⅓", {1, 3}}, {"⅔", {2, 3}},
        {"⅕", {1, 5}}, {"⅖", {2, 5}}, {"⅗", {3, 5}}, {"⅘", {4, 5}},
        {"⅙", {1, 6}}, {"⅚", {5, 6}},
        {"⅛", {1, 8}}, {"⅜", {3, 8}}, {"⅝", {5, 8}}, {"⅞", {7, 8}},
        {"⅐", {1, 7}}, {"⅑", {1, 9}}, {"⅒", {1, 10}},
        {"↉", {0, 3}},
    };
    return table;
}

const char* const kOpenBracket = "کەوانە";
const char* const kCloseBracket = "کەوانە داخستن";
const char* const kRange = "بۆ";
const char* const kNegative = "سالب";
const char* const kPositive = "موجەب";
const char* const kWith = "لەگەڵ";
const char* const kBase = "بنچینە";
const char* const kPower = "توان";

// Text a token had before this or an earlier pass rewrote it
const std::string& surface(const Token& t) {
    return t.is_converted ? t.original_text : t.text;
}

bool is_open_bracket(const std::string& s) { return s == "(" || s == "["; }
bool is_close_bracket(const std::string& s) { return s == ")" || s == "]"; }
bool is_bracket(const std::string& s) { return is_open_bracket(s) || is_close_bracket(s); }

bool is_operator_symbol(const std::string& s) {
    return operator_words().count(s) > 0;
}

// Operator symbol still in place, or one this pass already spoke
bool is_operator(const Token* t) {
    if (!t || t->is_dead()) return false;
    if (t->has_tag(tags::MathOperator)) return true;
    return !t->is_converted && is_operator_symbol(t->text);
}

bool is_single_greek(const std::string& s) {
    auto cps = text::decode(s);
    return cps.size() == 1 && lexicon::greek_letter_name(cps[0]) != nullptr;
}

bool is_math_term(const Token& t) {
    if (t.has_tag(tags::MathTerm) || t.has_tag(tags::MathFunction)) return true;
    if (t.is_converted) return false;
    return function_words().count(text::to_lower(t.text)) || is_single_greek(t.text);
}

bool is_latin_variable_text(const std::string& s) {
    if (s.empty() || s.size() > 2) return false;
    for (char c : s) {
        if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))) return false;
    }
    return true;
}

bool is_mathy(const Token* t) {
    if (!t || t->is_dead()) return false;
    if (is_numeric(*t)) return true;
    if (t->type == TokenType::Subscript || t->type == TokenType::Superscript) return true;
    if (is_math_term(*t)) return true;
    if (t->has_tag(tags::Fraction)) return true;
    return t->type == TokenType::Word && !t->is_converted && t->text.size() == 1 &&
           is_latin_variable_text(t->text);
}

bool is_active_math(const Token* t) {
    if (!t || t->is_dead()) return false;
    return is_operator(t) || is_bracket(surface(*t)) || is_math_term(*t);
}

bool is_unary_position(const Token* prev) {
    if (!prev) return true;
    const std::string& s = surface(*prev);
    return s == "(" || s == "[" || s == "{" || s == "=" || s == "," || is_operator(prev);
}

bool is_unit_word(const Token& t) {
    if (t.has_tag(tags::IsUnit) || t.has_tag(tags::UnitProcessed)) return true;
    if (t.type != TokenType::Word) return false;
    static const char* const spelled[] = {"مەتر", "گرام", "لیتر", "چرکە"};
    for (const char* s : spelled) {
        if (text::ends_with(t.text, s)) return true;
    }
    return false;
}

// Superscript/subscript digits to an integer literal
std::string script_digits(const std::string& run) {
    std::string out;
    for (UChar32 c : text::decode(run)) {
        if (c >= 0x2080 && c <= 0x2089) out += static_cast<char>('0' + (c - 0x2080));
        else if (c == 0x2070) out += '0';
        else if (c == 0x00B9) out += '1';
        else if (c == 0x00B2) out += '2';
        else if (c == 0x00B3) out += '3';
        else if (c >= 0x2074 && c <= 0x2079) out += static_cast<char>('0' + (c - 0x2070));
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

bool MathModule::is_strict_unit(const std::string& word) {
    static const std::unordered_set<std::string> units = {
        "m", "g", "l", "s", "h", "kg", "km", "cm", "mm", "ml", "mg",
        "gb", "mb", "kb", "tb", "ft", "yd", "mi", "in", "oz", "lb",
        "v", "w", "j", "pa", "n", "wh", "kwh", "kw", "mw", "hp",
        "mv", "ma", "kn", "psi", "kpa", "cal", "kcal", "kj", "gal", "mph", "ms"
    };
    return units.count(text::to_lower(word)) > 0;
}

bool MathModule::is_unicode_fraction(const std::string& s) {
    return unicode_fractions().count(s) > 0;
}

std::string MathModule::speak_fraction(long long num, long long den, bool mixed) {
    if (num == 1 && den == 2) return mixed ? "و نیو" : "نیوە";
    if (num == 1 && den == 4) return mixed ? "و چارەک" : "چارەک";
    std::string n = int_to_words(num);
    std::string d = int_to_words(den);
    if (mixed) return "ژمارەی تەواو و " + n + " لەسەر " + d;
    return n + " دابەش " + d;
}

// ---------------------------------------------------------------------------
// Pass
// ---------------------------------------------------------------------------

namespace {

struct MathPass {
    TokenList& tokens;

    Token* at(long i) {
        Token* t = token_at(tokens, i);
        return (t && !t->is_dead()) ? t : nullptr;
    }

    bool operator_context(long i) {
        Token* prev = at(i - 1);
        Token* next = at(i + 1);
        bool prev_valid = is_unary_position(prev) || is_mathy(prev) ||
                          is_close_bracket(surface(*prev));
        if (!prev_valid) return false;
        if (!next) return false;
        const std::string& n = surface(*next);
        return is_mathy(next) || is_open_bracket(n) || n == "-" || n == "−" ||
               n == "+" || n == "√";
    }

    bool isolated(long i) {
        return !is_active_math(at(i - 2)) && !is_active_math(at(i + 2));
    }

    // Whole bracket group made of math material with at least one operator
    long math_group_end(long open) {
        const long limit = open + 64;
        int depth = 0;
        bool has_operator = false;
        for (long k = open; k < static_cast<long>(tokens.size()) && k < limit; ++k) {
            Token& t = tokens[static_cast<size_t>(k)];
            if (t.is_dead()) continue;
            const std::string& s = surface(t);
            if (is_open_bracket(s)) {
                ++depth;
            } else if (is_close_bracket(s)) {
                if (--depth == 0) return has_operator ? k : -1;
            } else if (is_operator(&t)) {
                has_operator = true;
            } else if (!is_mathy(&t) && !is_latin_variable_text(t.text) &&
                       !unicode_fractions().count(t.text)) {
                return -1;
            }
        }
        return -1;
    }

    void speak_operator(Token& t, const std::string& spoken) {
        t.rewrite(spoken);
        t.add_tag(tags::MathOperator);
    }

    bool try_fraction(long i) {
        Token* prev = at(i - 1);
        Token* next = at(i + 1);
        if (!prev || !next) return false;
        if (prev->type != TokenType::Number || next->type != TokenType::Number) return false;
        if (prev->is_converted || next->is_converted) return false;
        if (!isolated(i)) return false;

        auto num = parse_int(prev->text);
        auto den = parse_int(next->text);
        if (!num || !den) return false;

        Token* before = at(i - 2);
        bool mixed = before && is_numeric(*before);
        prev->rewrite(MathModule::speak_fraction(*num, *den, mixed));
        prev->add_tag(tags::Fraction);
        prev->whitespace_after = next->whitespace_after;
        tokens[static_cast<size_t>(i)].erase();
        next->erase();
        return true;
    }

    void run() {
        for (long i = 0; i < static_cast<long>(tokens.size()); ++i) {
            Token& t = tokens[static_cast<size_t>(i)];
            if (t.is_dead() || t.is_converted || t.type == TokenType::Unknown) continue;
            Token* prev = at(i - 1);
            Token* next = at(i + 1);

            // Unicode vulgar fractions
            auto frac = unicode_fractions().find(t.text);
            if (frac != unicode_fractions().end()) {
                bool mixed = prev && is_numeric(*prev);
                t.rewrite(MathModule::speak_fraction(frac->second.first, frac->second.second, mixed));
                t.add_tag(tags::Fraction);
                continue;
            }

            if (t.type == TokenType::Subscript) {
                std::string digits = script_digits(t.text);
                if (digits.empty()) continue;
                t.rewrite(std::string(kBase) + " " + integer_to_words(digits));
                t.add_tag(tags::MathTerm);
                continue;
            }

            if (t.type == TokenType::Superscript) {
                if (prev && is_unit_word(*prev)) continue;
                std::string digits = script_digits(t.text);
                if (digits.empty()) continue;
                t.rewrite(std::string(kPower) + " " + integer_to_words(digits));
                t.add_tag(tags::MathTerm);
                continue;
            }

            if (t.type == TokenType::Word) {
                auto fn = function_words().find(text::to_lower(t.text));
                if (fn != function_words().end()) {
                    t.rewrite(fn->second);
                    t.add_tag(tags::MathFunction);
                    continue;
                }
                if (is_single_greek(t.text)) {
                    t.rewrite(lexicon::greek_letter_name(text::decode(t.text)[0]));
                    t.add_tag(tags::MathFunction);
                    continue;
                }
                if (is_latin_variable_text(t.text) && !MathModule::is_strict_unit(t.text) &&
                    variable_context(prev, t, next)) {
                    t.rewrite(spell_letters(text::to_lower(t.text)));
                    t.add_tag(tags::MathTerm);
                }
                continue;
            }

            if (t.type != TokenType::Symbol) continue;

            if (is_open_bracket(t.text)) {
                long close = math_group_end(i);
                if (close < 0) continue;
                Token& closing = tokens[static_cast<size_t>(close)];
                t.rewrite(kOpenBracket);
                t.add_tag(tags::MathTerm);
                closing.rewrite(kCloseBracket);
                closing.add_tag(tags::MathTerm);
                continue;
            }

            if (!is_operator_symbol(t.text)) continue;

            if (t.text == "+" && prev && next && prev->type == TokenType::Word &&
                !is_math_term(*prev) && !prev->has_tag(tags::MathOperator)) {
                if (next->type == TokenType::Word && text::length(prev->text) > 1) {
                    speak_operator(t, kWith);
                    continue;
                }
                if (is_numeric(*next)) continue;
            }

            // Exponents of units belong to the unit module
            if (t.text == "^" && prev && is_unit_word(*prev)) continue;

            if (!operator_context(i)) continue;

            if (t.text == "-" || t.text == "−") {
                if (prev && next && is_numeric(*prev) && is_numeric(*next) && isolated(i)) {
                    speak_operator(t, kRange);
                    continue;
                }
            }

            if (t.text == "/" || t.text == "÷") {
                if (prev && next && is_unit_word(*prev) && is_unit_word(*next)) continue;
                if (t.text == "/" && try_fraction(i)) continue;
            }

            if (is_unary_position(prev) && (t.text == "-" || t.text == "−" || t.text == "+")) {
                speak_operator(t, t.text == "+" ? kPositive : kNegative);
                continue;
            }

            speak_operator(t, operator_words().at(t.text));
        }
    }

    // 1-2 Latin letters bound to a number, bracket, operator or script digits.
    // A single letter binds to a number across a space; two letters only when
    // glued to it, so short prose words stay words.
    static bool variable_context(const Token* prev, const Token& cur, const Token* next) {
        bool single = cur.text.size() == 1;
        if (prev && is_numeric(*prev) && (single || is_tight(*prev))) return true;
        if (next && is_numeric(*next) && (single || is_tight(cur))) return true;
        if (next && (next->type == TokenType::Superscript || next->type == TokenType::Subscript) &&
            is_tight(cur)) {
            return true;
        }
        if (is_operator(prev) || is_operator(next)) return true;
        if (prev && is_bracket(surface(*prev))) return true;
        if (next && is_bracket(surface(*next))) return true;
        return false;
    }
};

} // anonymous namespace

void MathModule::process(TokenList& tokens) const {
    MathPass pass{tokens};
    pass.run();
}

} // namespace ckbtext
