#include <ckbtext/transliterate.hpp>
#include <ckbtext/lexicon.hpp>
#include <ckbtext/numbers.hpp>
#include <ckbtext/text.hpp>
#include <cstring>
#include <vector>

namespace ckbtext {

namespace {

bool is_foreign_script(text::Script s) {
    return s == text::Script::Latin || s == text::Script::Cyrillic ||
           s == text::Script::Greek;
}

bool is_latin_vowel(char c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

struct Digraph {
    const char* latin;
    const char* kurdish;
};

const Digraph kDigraphs[] = {
    {"shch", "شچ"},
    {"sh", "ش"}, {"ch", "چ"}, {"zh", "ژ"}, {"kh", "خ"}, {"gh", "غ"},
    {"ph", "ف"}, {"th", "ت"}, {"ck", "ک"}, {"qu", "کو"}, {"ts", "تس"},
    {"oo", "وو"}, {"ee", "ی"}, {"ou", "وو"}, {"ow", "ۆ"},
    {"ai", "ەی"}, {"ay", "ەی"}, {"ei", "ەی"}, {"ey", "ەی"},
    {"yo", "یۆ"}, {"yu", "یو"}, {"ya", "یا"}, {"ye", "یە"},
};

const char* single_letter(char c, char next) {
    switch (c) {
    case 'a': return "ا";
    case 'b': return "ب";
    case 'c': return (next == 'e' || next == 'i' || next == 'y') ? "س" : "ک";
    case 'd': return "د";
    case 'e': return "ە";
    case 'f': return "ف";
    case 'g': return "گ";
    case 'h': return "ھ";
    case 'i': return "ی";
    case 'j': return "ج";
    case 'k': return "ک";
    case 'l': return "ل";
    case 'm': return "م";
    case 'n': return "ن";
    case 'o': return "ۆ";
    case 'p': return "پ";
    case 'q': return "ک";
    case 'r': return "ر";
    case 's': return "س";
    case 't': return "ت";
    case 'u': return "و";
    case 'v': return "ڤ";
    case 'w': return "و";
    case 'x': return "کس";
    case 'y': return "ی";
    case 'z': return "ز";
    default:  return nullptr;
    }
}

// Lowercase, accent-fold and romanize Cyrillic/Greek
std::string to_plain_latin(const std::string& word) {
    std::string folded = text::to_lower(text::fold_accents(word));
    std::string out;
    for (UChar32 c : text::decode(folded)) {
        if (const char* roman = lexicon::romanize(c)) {
            out += roman;
        } else {
            out += text::encode(c);
        }
    }
    return out;
}

enum class RunKind { Letters, Digits, Native, Other };

RunKind run_kind(UChar32 c) {
    if (text::is_digit(c)) return RunKind::Digits;
    if (text::is_letter(c) || text::is_mark(c)) {
        return is_foreign_script(text::script_of(c)) || text::is_mark(c)
            ? RunKind::Letters : RunKind::Native;
    }
    return RunKind::Other;
}

const char* separator_name(UChar32 c) {
    switch (c) {
    case '.': return "دۆت";
    case '@': return "ئەت";
    case '/': return "سلاش";
    case '\\': return "باکسلاش";
    case '-': return "داش";
    case '_': return "ئەندەرسکۆڕ";
    case ':': return "کۆلۆن";
    case '?': return "پرسیار";
    case '=': return "یەکسان";
    case '&': return "ئەند";
    case '#': return "ھاشتاگ";
    case '+': return "پڵەس";
    case '%': return "لە سەدا";
    case '~': return "تیلد";
    default:  return nullptr;
    }
}

std::string speak_letter_run(const std::string& run) {
    std::string lower = text::to_lower(run);
    if (auto known = lexicon::english_word(lower)) return *known;
    if (text::length(run) <= 2 || is_acronym(run)) {
        std::string spelled = spell_letters(run);
        if (!spelled.empty()) return spelled;
    }
    return transliterate_word(run);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Letters and acronyms
// ---------------------------------------------------------------------------

std::string spell_letters(const std::string& word) {
    std::vector<std::string> parts;
    for (UChar32 c : text::decode(word)) {
        if (const char* name = lexicon::letter_name(c)) {
            parts.push_back(name);
        } else if (const char* greek = lexicon::greek_letter_name(c)) {
            parts.push_back(greek);
        } else if (text::is_digit(c)) {
            parts.push_back(digits_to_words(text::encode(c)));
        }
    }
    return text::join(parts, " ");
}

bool is_acronym(const std::string& word) {
    if (word.empty() || word.size() > 5) return false;
    for (char c : word) {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}

bool has_foreign_letters(const std::string& word) {
    for (UChar32 c : text::decode(word)) {
        if (text::is_letter(c) && is_foreign_script(text::script_of(c))) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Latin rules
// ---------------------------------------------------------------------------

std::string latin_to_kurdish(const std::string& word) {
    std::string out;
    size_t i = 0;
    char prev = 0;
    while (i < word.size()) {
        char c = word[i];
        bool initial = (i == 0);

        if (c < 'a' || c > 'z') {
            out += c;
            prev = c;
            ++i;
            continue;
        }

        // Doubled consonants are pronounced once
        if (c == prev && !is_latin_vowel(c)) {
            if (c == 'r') {
                // "rr" is the trilled ڕ
                std::string plain_r = "ر";
                if (text::ends_with(out, plain_r)) {
                    out.erase(out.size() - plain_r.size());
                    out += "ڕ";
                }
            }
            ++i;
            continue;
        }

        const Digraph* matched = nullptr;
        for (const auto& d : kDigraphs) {
            size_t n = std::strlen(d.latin);
            if (word.compare(i, n, d.latin) == 0) {
                matched = &d;
                break;
            }
        }

        if (initial && is_latin_vowel(c)) out += "ئ";

        if (matched) {
            out += matched->kurdish;
            size_t n = std::strlen(matched->latin);
            prev = word[i + n - 1];
            i += n;
            continue;
        }

        if (initial && c == 'r') {
            out += "ڕ";
        } else {
            char next = i + 1 < word.size() ? word[i + 1] : 0;
            const char* k = single_letter(c, next);
            if (k) out += k;
        }
        prev = c;
        ++i;
    }
    return out;
}

std::string transliterate_word(const std::string& word) {
    if (!has_foreign_letters(word)) return word;

    // Split a trailing Arabic-script suffix off the foreign stem
    std::string stem;
    std::string tail;
    size_t i = 0;
    while (i < word.size()) {
        size_t start = i;
        UChar32 c = text::next_code_point(word, i);
        if (c == text::kTatweel ||
            (text::is_letter(c) && text::script_of(c) == text::Script::Arabic)) {
            tail = word.substr(start);
            break;
        }
        stem.append(word, start, i - start);
    }
    tail = text::strip_joiners(tail);

    std::string spoken;
    if (auto known = lexicon::english_word(text::to_lower(text::fold_accents(stem)))) {
        spoken = *known;
    } else if (is_acronym(stem)) {
        spoken = spell_letters(stem);
    } else {
        std::string plain = to_plain_latin(stem);
        if (auto known_plain = lexicon::english_word(plain)) {
            spoken = *known_plain;
        } else {
            spoken = latin_to_kurdish(plain);
        }
    }
    return spoken + tail;
}

// ---------------------------------------------------------------------------
// Identifier / address spelling
// ---------------------------------------------------------------------------

std::string spell_out(const std::string& code) {
    std::vector<std::string> parts;
    std::string run;
    RunKind kind = RunKind::Other;

    auto flush = [&]() {
        if (run.empty()) return;
        switch (kind) {
        case RunKind::Letters:
            parts.push_back(speak_letter_run(run));
            break;
        case RunKind::Digits: {
            std::string ascii = text::ascii_digits(run);
            parts.push_back(ascii.size() > 1 && ascii[0] == '0'
                                ? digits_to_words(ascii)
                                : integer_to_words(ascii));
            break;
        }
        case RunKind::Native:
            parts.push_back(run);
            break;
        case RunKind::Other:
            break;
        }
        run.clear();
    };

    for (UChar32 c : text::decode(code)) {
        RunKind k = run_kind(c);
        if (k == RunKind::Other) {
            flush();
            if (const char* name = separator_name(c)) parts.push_back(name);
            kind = k;
            continue;
        }
        if (k != kind) flush();
        kind = k;
        run += text::encode(c);
    }
    flush();
    return text::join(parts, " ");
}

} // namespace ckbtext
