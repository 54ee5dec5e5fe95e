#include <ckbtext/modules/diacritics.hpp>
#include <ckbtext/log.hpp>
#include <ckbtext/text.hpp>
#include <vector>

namespace ckbtext {

namespace {

using Vowel = DiacriticsModule::Vowel;

// ---------------------------------------------------------------------------
// Letters and marks
// ---------------------------------------------------------------------------

constexpr UChar32 kHamza        = 0x0621;
constexpr UChar32 kAlefMadda    = 0x0622;
constexpr UChar32 kAlefHamza    = 0x0623;
constexpr UChar32 kWawHamza     = 0x0624;
constexpr UChar32 kAlefHamzaLow = 0x0625;
constexpr UChar32 kYehHamza     = 0x0626;
constexpr UChar32 kAlef         = 0x0627;
constexpr UChar32 kTehMarbuta   = 0x0629;
constexpr UChar32 kReh          = 0x0631;
constexpr UChar32 kLam          = 0x0644;
constexpr UChar32 kMeem         = 0x0645;
constexpr UChar32 kNoon         = 0x0646;
constexpr UChar32 kHeh          = 0x0647;
constexpr UChar32 kWaw          = 0x0648;
constexpr UChar32 kAlefMaksura  = 0x0649;
constexpr UChar32 kYeh          = 0x064A;
constexpr UChar32 kBeh          = 0x0628;
constexpr UChar32 kAlefWasla    = 0x0671;
constexpr UChar32 kFarsiYeh     = 0x06CC;

constexpr UChar32 kFathatan   = 0x064B;
constexpr UChar32 kDammatan   = 0x064C;
constexpr UChar32 kKasratan   = 0x064D;
constexpr UChar32 kFatha      = 0x064E;
constexpr UChar32 kDamma      = 0x064F;
constexpr UChar32 kKasra      = 0x0650;
constexpr UChar32 kShadda     = 0x0651;
constexpr UChar32 kSukun      = 0x0652;
constexpr UChar32 kDaggerAlef = 0x0670;
constexpr UChar32 kSilentZero = 0x06DF;
constexpr UChar32 kQuranSukun = 0x06E1;

struct Unit {
    UChar32 base = 0;
    Vowel vowel = Vowel::None;
    Vowel tanween = Vowel::None;
    bool sukun = false;
    bool shadda = false;
    bool dagger_alef = false;
    bool silent = false;

    bool bare() const {
        return vowel == Vowel::None && tanween == Vowel::None && !sukun && !dagger_alef;
    }
};

std::vector<Unit> parse_units(const std::string& word) {
    std::vector<Unit> units;
    for (UChar32 c : text::decode(word)) {
        if (!text::is_arabic_diacritic(c)) {
            Unit u;
            u.base = c;
            units.push_back(u);
            continue;
        }
        if (units.empty()) continue;
        Unit& u = units.back();
        switch (c) {
        case kFatha:      u.vowel = Vowel::Fatha; break;
        case kKasra:      u.vowel = Vowel::Kasra; break;
        case kDamma:      u.vowel = Vowel::Damma; break;
        case kFathatan:   u.tanween = Vowel::Fatha; break;
        case kKasratan:   u.tanween = Vowel::Kasra; break;
        case kDammatan:   u.tanween = Vowel::Damma; break;
        case kShadda:     u.shadda = true; break;
        case kSukun:
        case kQuranSukun: u.sukun = true; break;
        case kDaggerAlef: u.dagger_alef = true; break;
        case kSilentZero: u.silent = true; break;
        default: break;   // recitation marks are not pronounced
        }
    }
    return units;
}

bool is_sun_letter(UChar32 c) {
    switch (c) {
    case 0x062A: case 0x062B: case 0x062F: case 0x0630: case 0x0631:
    case 0x0632: case 0x0633: case 0x0634: case 0x0635: case 0x0636:
    case 0x0637: case 0x0638: case kLam: case kNoon:
        return true;
    default:
        return false;
    }
}

// Emphatic letters that make a following-vowelless ra heavy
bool is_heavy_letter(UChar32 c) {
    switch (c) {
    case 0x062E: case 0x0635: case 0x0636: case 0x063A:
    case 0x0637: case 0x0642: case 0x0638:
        return true;
    default:
        return false;
    }
}

bool is_alef_like(UChar32 c) {
    return c == kAlef || c == kAlefWasla;
}

bool is_sentence_end(const std::string& s) {
    return s == "." || s == "!" || s == "?" || s == "؟" || s == "۔" || s == "…";
}

// First letter of the next word, for nasal assimilation across words
UChar32 first_base(const std::string& word) {
    for (UChar32 c : text::decode(word)) {
        if (!text::is_arabic_diacritic(c)) return c;
    }
    return 0;
}

// ن / tanween nasal before ب م ي و
const char* nasal_for(UChar32 following) {
    switch (following) {
    case kBeh:
    case kMeem:      return "م";
    case kYeh:
    case kFarsiYeh:  return "ی";
    case kWaw:       return "و";
    default:         return "ن";
    }
}

const char* short_vowel(Vowel v) {
    switch (v) {
    case Vowel::Fatha: return "ە";
    case Vowel::Kasra: return "ی";
    case Vowel::Damma: return "و";
    case Vowel::None:  break;
    }
    return "";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Word conversion
// ---------------------------------------------------------------------------

std::string DiacriticsModule::strip_marks(const std::string& word) {
    std::string out;
    for (UChar32 c : text::decode(word)) {
        if (text::is_arabic_diacritic(c)) continue;
        out += text::encode(c == kAlefWasla ? kAlef : c);
    }
    return out;
}

std::string DiacriticsModule::convert_word(const std::string& word, WordContext& ctx) const {
    std::vector<Unit> units = parse_units(word);
    const bool double_shadda = config().shadda == ShaddaMode::Double;
    const size_t n = units.size();

    std::string out;
    Vowel last = ctx.previous;
    bool after_fathatan = false;

    for (size_t k = 0; k < n; ++k) {
        const Unit& u = units[k];
        const Unit* next = k + 1 < n ? &units[k + 1] : nullptr;
        const Unit* prev = k > 0 ? &units[k - 1] : nullptr;
        UChar32 following = next ? next->base : first_base(ctx.next_word);

        if (u.silent) continue;

        // Definite article alef: "ئە" at utterance start, silent elsewhere
        bool article_alef = u.base == kAlefWasla ||
                            (k == 0 && u.base == kAlef && u.bare() && next && next->base == kLam);
        if (article_alef) {
            if (k == 0 && ctx.utterance_start) {
                out += "ئە";
                last = Vowel::Fatha;
            }
            continue;
        }

        if (u.base == kLam) {
            bool after_article = prev && is_alef_like(prev->base);
            bool lam_bare = u.bare() || (u.sukun && u.vowel == Vowel::None);

            // Article lam of the divine name ("ٱللَّه", "لله")
            if (lam_bare && (k == 0 || after_article) && next && next->base == kLam &&
                next->shadda && k + 2 < n && units[k + 2].base == kHeh) {
                continue;
            }
            // Lam of the divine name: light after kasra, heavy otherwise
            if (u.shadda && prev && prev->base == kLam && next && next->base == kHeh) {
                out += last == Vowel::Kasra ? "للا" : "ڵڵا";
                last = Vowel::Fatha;
                continue;
            }
            // Sun-letter assimilation
            if (after_article && lam_bare && next && is_sun_letter(next->base)) {
                continue;
            }
        }

        // Base letter
        std::string letter;
        switch (u.base) {
        case kHamza:
        case kYehHamza:
        case kWawHamza:
            letter = "ئ";
            break;
        case kAlefHamza:
            letter = u.vowel == Vowel::None && u.tanween == Vowel::None ? "ئە" : "ئ";
            break;
        case kAlefHamzaLow:
            letter = u.vowel == Vowel::None && u.tanween == Vowel::None ? "ئی" : "ئ";
            break;
        case kAlefMadda:
            letter = "ئا";
            break;
        case kAlef:
            if (after_fathatan && !next) {
                letter.clear();          // alef carrying the tanween
            } else {
                letter = (k == 0 && u.bare()) ? "ئا" : "ا";
            }
            break;
        case kAlefMaksura:
            if (u.dagger_alef) letter.clear();
            else letter = last == Vowel::Fatha ? "ا" : "ی";
            break;
        case kTehMarbuta:
            letter = (u.vowel != Vowel::None || u.tanween != Vowel::None) ? "ت" : "ە";
            break;
        case kReh: {
            bool heavy;
            Vowel own = u.vowel != Vowel::None ? u.vowel : u.tanween;
            if (own == Vowel::Fatha || own == Vowel::Damma) heavy = true;
            else if (own == Vowel::Kasra) heavy = false;
            else if (next && is_heavy_letter(next->base)) heavy = true;
            else heavy = last == Vowel::Fatha || last == Vowel::Damma;
            letter = heavy ? "ڕ" : "ر";
            break;
        }
        case kNoon:
            if (u.sukun || (u.bare() && !next)) letter = nasal_for(following);
            else letter = "ن";
            break;
        case 0x062B: letter = "س"; break;   // ث
        case 0x0630: letter = "ز"; break;   // ذ
        case 0x0635: letter = "س"; break;   // ص
        case 0x0636: letter = "ز"; break;   // ض
        case 0x0637: letter = "ت"; break;   // ط
        case 0x0638: letter = "ز"; break;   // ظ
        case 0x0643: letter = "ک"; break;   // ك
        case kYeh:   letter = "ی"; break;
        case kHeh:   letter = "ھ"; break;
        default:     letter = text::encode(u.base); break;
        }

        out += letter;
        if (u.shadda && double_shadda && !letter.empty()) out += letter;

        // Vowel
        after_fathatan = false;
        if (u.dagger_alef) {
            out += "ا";
            last = Vowel::Fatha;
        } else if (u.tanween != Vowel::None) {
            out += short_vowel(u.tanween);
            out += nasal_for(following);
            after_fathatan = u.tanween == Vowel::Fatha;
            last = Vowel::Kasra;
        } else if (u.vowel == Vowel::Fatha) {
            bool long_a = next && (next->base == kAlef || next->base == kAlefMaksura) && next->bare();
            if (!long_a) out += short_vowel(Vowel::Fatha);
            last = Vowel::Fatha;
        } else if (u.vowel == Vowel::Kasra) {
            bool long_i = next && next->base == kYeh && (next->bare() || next->sukun);
            if (!long_i) out += short_vowel(Vowel::Kasra);
            last = Vowel::Kasra;
        } else if (u.vowel == Vowel::Damma) {
            out += short_vowel(Vowel::Damma);
            last = Vowel::Damma;
        }
    }

    ctx.previous = last;
    return out;
}

// ---------------------------------------------------------------------------
// Pass
// ---------------------------------------------------------------------------

void DiacriticsModule::process(TokenList& tokens) const {
    DiacriticsMode mode = config().diacritics_mode;
    if (mode == DiacriticsMode::Keep) return;

    WordContext ctx;
    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead()) continue;

        if (t.type == TokenType::Symbol && is_sentence_end(t.text)) {
            ctx.utterance_start = true;
            ctx.previous = Vowel::None;
            continue;
        }
        if (t.type != TokenType::Word || t.is_converted) continue;

        if (!text::has_arabic_diacritics(t.text)) {
            ctx.utterance_start = false;
            ctx.previous = Vowel::None;
            continue;
        }

        if (mode == DiacriticsMode::Remove) {
            t.text = strip_marks(t.text);
        } else {
            ctx.next_word.clear();
            for (size_t k = i + 1; k < tokens.size(); ++k) {
                if (tokens[k].is_dead()) continue;
                if (tokens[k].type == TokenType::Word) ctx.next_word = tokens[k].text;
                break;
            }
            std::string spoken = convert_word(t.text, ctx);
            logger().trace("%s -> %s", t.text.c_str(), spoken.c_str());
            t.rewrite(spoken);
        }
        ctx.utterance_start = false;
    }
}

} // namespace ckbtext
