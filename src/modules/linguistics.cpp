#include <ckbtext/modules/linguistics.hpp>
#include <ckbtext/text.hpp>
#include <unordered_map>
#include <vector>

namespace ckbtext {

namespace {

const std::unordered_map<std::string, std::string>& abbreviations() {
    static const std::unordered_map<std::string, std::string> table = {
        {"هتد", "ھەتا دوایی"},
        {"ھتد", "ھەتا دوایی"},
        {"د.", "دکتۆر"},
        {"پ.ز", "پێش زایین"},
        {"ز.", "زایینی"},
        {"پ.د", "پرۆفیسۆری دکتۆر"},
        {"م.", "مامۆستا"},
        {"ک.", "کاک"},
        {"ھ.ک", "ھەرێمی کوردستان"},
    };
    return table;
}

const std::unordered_map<std::string, std::string>& arabic_names() {
    static const std::unordered_map<std::string, std::string> table = {
        {"علي", "عەلی"},
        {"محمد", "موحەممەد"},
        {"احمد", "ئەحمەد"},
        {"أحمد", "ئەحمەد"},
        {"حسن", "حەسەن"},
        {"حسين", "حوسێن"},
        {"عمر", "عومەر"},
        {"فاطمة", "فاتیمە"},
        {"خديجة", "خەدیجە"},
        {"عبدالله", "عەبدوڵڵا"},
        {"ابراهيم", "ئیبراھیم"},
        {"إبراهيم", "ئیبراھیم"},
        {"يوسف", "یوسف"},
        {"مصطفى", "مستەفا"},
        {"جعفر", "جەعفەر"},
        {"زينب", "زەینەب"},
        {"مريم", "مەریەم"},
        {"عثمان", "عوسمان"},
    };
    return table;
}

constexpr UChar32 kArabicHeh = 0x0647;

// Longest abbreviation starting at token i made of tight WORD/"." tokens
size_t match_abbreviation(const TokenList& tokens, size_t i, std::string& expansion) {
    std::string joined;
    size_t best = 0;
    for (size_t k = i; k < tokens.size() && k < i + 3; ++k) {
        const Token& t = tokens[k];
        if (t.is_dead() || t.is_converted) break;
        if (t.type != TokenType::Word && t.text != ".") break;
        joined += t.text;
        auto it = abbreviations().find(joined);
        if (it != abbreviations().end()) {
            expansion = it->second;
            best = k - i + 1;
        }
        if (!is_tight(t)) break;
    }
    return best;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Script tagger
// ---------------------------------------------------------------------------

void ScriptTaggerModule::process(TokenList& tokens) const {
    for (auto& t : tokens) {
        if (t.is_dead() || t.type != TokenType::Word) continue;
        switch (text::script_of(t.text)) {
        case text::Script::Latin:    t.add_tag(tags::ScriptLatin); break;
        case text::Script::Arabic:   t.add_tag(tags::ScriptKurdish); break;
        case text::Script::Cyrillic: t.add_tag(tags::ScriptCyrillic); break;
        case text::Script::Greek:    t.add_tag(tags::ScriptGreek); break;
        case text::Script::Cjk:      t.add_tag(tags::ScriptCjk); break;
        case text::Script::Other:    t.add_tag(tags::ScriptOther); break;
        case text::Script::None:     break;
        }
    }
}

// ---------------------------------------------------------------------------
// Linguistics
// ---------------------------------------------------------------------------

std::string LinguisticsModule::canonicalize(const std::string& word) {
    std::vector<UChar32> cps;
    for (UChar32 c : text::decode(word)) {
        if (c == text::kTatweel || c == text::kZwnj || c == text::kZwj) continue;
        cps.push_back(c);
    }

    std::string out;
    for (size_t k = 0; k < cps.size(); ++k) {
        UChar32 c = cps[k];
        switch (c) {
        case 0x0643: c = 0x06A9; break;   // ك -> ک
        case 0x064A:                      // ي -> ی
        case 0x0649: c = 0x06CC; break;   // ى -> ی
        case 0x0629: c = 0x06D5; break;   // ة -> ە
        case kArabicHeh:
            // Word-final heh is the Sorani vowel ە
            c = (k + 1 == cps.size() && k > 0) ? 0x06D5 : 0x06BE;
            break;
        default: break;
        }
        out += text::encode(c);
    }
    return out;
}

void LinguisticsModule::process(TokenList& tokens) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || t.is_converted || t.type != TokenType::Word) continue;
        if (text::script_of(t.text) != text::Script::Arabic) continue;

        std::string expansion;
        size_t span = match_abbreviation(tokens, i, expansion);
        if (span > 0) {
            t.whitespace_after = tokens[i + span - 1].whitespace_after;
            for (size_t k = i + 1; k < i + span; ++k) tokens[k].erase();
            t.rewrite(expansion);
            i += span - 1;
            continue;
        }

        auto name = arabic_names().find(t.text);
        if (name != arabic_names().end()) {
            t.rewrite(name->second);
            continue;
        }

        std::string canonical = canonicalize(t.text);
        auto canonical_name = arabic_names().find(canonical);
        if (canonical_name != arabic_names().end()) {
            t.rewrite(canonical_name->second);
        } else if (canonical != t.text) {
            t.text = canonical;
        }
    }
}

} // namespace ckbtext
