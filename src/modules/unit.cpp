#include <ckbtext/modules/unit.hpp>
#include <ckbtext/modules/math.hpp>
#include <ckbtext/numbers.hpp>
#include <ckbtext/suffixes.hpp>
#include <ckbtext/text.hpp>
#include <unordered_map>

namespace ckbtext {

namespace {

const std::unordered_map<std::string, const char*>& unit_names() {
    static const std::unordered_map<std::string, const char*> names = {
        // Length
        {"mm", "میلیمەتر"}, {"cm", "سانتیمەتر"}, {"m", "مەتر"},
        {"km", "کیلۆمەتر"}, {"in", "ئینچ"}, {"ft", "پێ"}, {"yd", "یارد"},
        {"mi", "مایل"},
        // Mass
        {"mg", "میلیگرام"}, {"g", "گرام"}, {"kg", "کیلۆگرام"},
        {"oz", "ئۆنس"}, {"lb", "پاوەند"},
        // Volume
        {"ml", "میلیلیتر"}, {"l", "لیتر"}, {"gal", "گالۆن"},
        // Time
        {"ms", "میلیچرکە"}, {"s", "چرکە"}, {"sec", "چرکە"},
        {"min", "خولەک"}, {"h", "کاتژمێر"}, {"hr", "کاتژمێر"},
        // Data
        {"kb", "کیلۆبایت"}, {"mb", "مێگابایت"}, {"gb", "گێگابایت"},
        {"tb", "تێرابایت"},
        // Electrical and energy
        {"v", "ڤۆڵت"}, {"mv", "میلیڤۆڵت"}, {"ma", "میلیئەمپێر"},
        {"w", "وات"}, {"kw", "کیلۆوات"}, {"mw", "مێگاوات"},
        {"wh", "وات کاتژمێر"}, {"kwh", "کیلۆوات کاتژمێر"},
        {"j", "جووڵ"}, {"kj", "کیلۆجووڵ"}, {"cal", "کالۆری"},
        {"kcal", "کیلۆکالۆری"}, {"hp", "ھێزی ئەسپ"},
        // Force and pressure
        {"n", "نیوتن"}, {"kn", "کیلۆنیوتن"}, {"pa", "پاسکاڵ"},
        {"kpa", "کیلۆپاسکاڵ"}, {"psi", "پی ئێس ئای"},
        // Frequency and speed
        {"hz", "ھێرتز"}, {"khz", "کیلۆھێرتز"}, {"mhz", "مێگاھێرتز"},
        {"ghz", "گێگاھێرتز"}, {"mph", "مایل لە کاتژمێرێکدا"},
        {"kmh", "کیلۆمەتر لە کاتژمێرێکدا"},
    };
    return names;
}

const char* const kSquared = "دووجا";
const char* const kCubed = "سێجا";

bool is_unit_tagged(const Token* t) {
    return t && !t->is_dead() && t->has_tag(tags::IsUnit);
}

// "d.5" literal with a single non-zero integer digit
std::optional<std::string> half_literal(const Token& t) {
    if (t.type != TokenType::Number || t.is_converted) return std::nullopt;
    std::string ascii = text::ascii_digits(t.text);
    if (ascii.size() != 3 || ascii[1] != '.' || ascii[2] != '5') return std::nullopt;
    if (ascii[0] < '1' || ascii[0] > '9') return std::nullopt;
    return ascii.substr(0, 1);
}

// Number, spoken fraction or vulgar fraction a unit can measure
bool is_quantity(const Token* t) {
    if (!t || t->is_dead()) return false;
    if (is_numeric(*t) || t->has_tag(tags::Fraction)) return true;
    return !t->is_converted && MathModule::is_unicode_fraction(t->text);
}

long next_live(const TokenList& tokens, long from) {
    long k = from;
    while (k < static_cast<long>(tokens.size()) && tokens[static_cast<size_t>(k)].is_dead()) ++k;
    return k;
}

} // anonymous namespace

std::optional<UnitInfo> lookup_unit(const std::string& word, std::string* suffix) {
    std::string stem = word;
    std::string tail;
    size_t tatweel = word.find("ـ");
    if (tatweel != std::string::npos) {
        stem = word.substr(0, tatweel);
        tail = strip_leading_joiners(word.substr(tatweel));
        if (!tail.empty() && !is_grammar_suffix(tail)) return std::nullopt;
    }

    auto it = unit_names().find(text::to_lower(stem));
    if (it == unit_names().end()) return std::nullopt;
    if (suffix) *suffix = tail;
    return UnitInfo{it->second, MathModule::is_strict_unit(stem)};
}

// ---------------------------------------------------------------------------
// Tagger
// ---------------------------------------------------------------------------

void UnitTaggerModule::process(TokenList& tokens) const {
    for (long i = 0; i < static_cast<long>(tokens.size()); ++i) {
        Token& t = tokens[static_cast<size_t>(i)];
        if (t.is_dead() || t.is_converted || t.type != TokenType::Word) continue;
        if (!lookup_unit(t.text)) continue;

        const Token* prev = token_at(tokens, i - 1);
        const Token* next = token_at(tokens, i + 1);

        bool after_number = is_quantity(prev);
        bool rate = is_symbol(prev, "/") && is_unit_tagged(token_at(tokens, i - 2));
        bool powered = next && (next->type == TokenType::Superscript || next->text == "^") &&
                       prev && (prev->type == TokenType::Number || is_quantity(prev));

        if (after_number || rate || powered) t.add_tag(tags::IsUnit);
    }
}

// ---------------------------------------------------------------------------
// Normalizer
// ---------------------------------------------------------------------------

void UnitModule::process(TokenList& tokens) const {
    for (long i = 0; i < static_cast<long>(tokens.size()); ++i) {
        Token& t = tokens[static_cast<size_t>(i)];
        if (t.is_dead() || t.is_converted) continue;
        if (!t.has_tag(tags::IsUnit) || t.has_tag(tags::UnitProcessed)) continue;

        std::string suffix;
        auto unit = lookup_unit(t.text, &suffix);
        if (!unit) continue;
        std::string spoken = unit->spoken;

        // unit/unit rate: "کیلۆمەتر بۆ ھەر کاتژمێرێک"
        Token* slash = token_at(tokens, i + 1);
        Token* denom = token_at(tokens, i + 2);
        if (is_symbol(slash, "/") && is_unit_tagged(denom) && !denom->is_converted) {
            std::string denom_suffix;
            auto per = lookup_unit(denom->text, &denom_suffix);
            if (per) {
                std::string per_word = per->spoken;
                per_word += ends_with_vowel(per_word) ? "یەک" : "ێک";
                spoken += " بۆ ھەر " + per_word;
                if (!denom_suffix.empty()) suffix = denom_suffix;
                t.whitespace_after = denom->whitespace_after;
                slash->erase();
                denom->erase();
                denom->add_tag(tags::UnitProcessed);
            }
        }

        // Squared / cubed
        long n = next_live(tokens, i + 1);
        Token* next = token_at(tokens, n);
        if (next && next->type == TokenType::Superscript) {
            if (next->text == "²" || next->text == "³") {
                spoken += std::string(" ") + (next->text == "²" ? kSquared : kCubed);
                t.whitespace_after = next->whitespace_after;
                next->erase();
            }
        } else if (is_symbol(next, "^")) {
            Token* power = token_at(tokens, next_live(tokens, n + 1));
            std::string exponent = power ? text::ascii_digits(power->text) : std::string();
            if (exponent == "2" || exponent == "3") {
                spoken += std::string(" ") + (exponent == "2" ? kSquared : kCubed);
                t.whitespace_after = power->whitespace_after;
                next->erase();
                power->erase();
            }
        }

        // "2.5 km" -> "دوو کیلۆمەتر و نیو"
        Token* prev = token_at(tokens, i - 1);
        if (prev && !prev->is_dead()) {
            if (auto whole = half_literal(*prev)) {
                prev->rewrite(integer_to_words(*whole));
                spoken += " و نیو";
            }
        }

        t.rewrite(append_suffix(spoken, suffix));
        t.add_tag(tags::UnitProcessed);
    }
}

} // namespace ckbtext
