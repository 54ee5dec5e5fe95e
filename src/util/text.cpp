#include <ckbtext/text.hpp>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/uscript.h>
#include <unicode/utf8.h>
#include <algorithm>
#include <cstdint>
#include <iterator>

namespace ckbtext::text {

// ---------------------------------------------------------------------------
// UTF-8
// ---------------------------------------------------------------------------

UChar32 next_code_point(const std::string& s, size_t& i) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t pos = static_cast<int32_t>(i);
    int32_t len = static_cast<int32_t>(s.size());
    UChar32 c = 0;
    U8_NEXT(bytes, pos, len, c);
    i = static_cast<size_t>(pos);
    return c;
}

Status check_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t at = i;
        if (next_code_point(s, i) < 0) {
            return CkbError::in_text(CkbError::Encoding, "malformed UTF-8 sequence", s, at);
        }
    }
    return ok_status();
}

std::vector<UChar32> decode(const std::string& s) {
    std::vector<UChar32> out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        UChar32 c = next_code_point(s, i);
        if (c >= 0) out.push_back(c);
    }
    return out;
}

std::string encode(UChar32 cp) {
    uint8_t buf[U8_MAX_LENGTH];
    int32_t n = 0;
    UBool error = false;
    U8_APPEND(buf, n, U8_MAX_LENGTH, cp, error);
    if (error) return std::string();
    return std::string(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
}

std::string encode(const std::vector<UChar32>& cps) {
    std::string out;
    out.reserve(cps.size() * 2);
    for (UChar32 c : cps) out += encode(c);
    return out;
}

std::vector<std::string> split_chars(const std::string& s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        size_t start = i;
        next_code_point(s, i);
        out.push_back(s.substr(start, i - start));
    }
    return out;
}

size_t length(const std::string& s) {
    size_t n = 0;
    size_t i = 0;
    while (i < s.size()) {
        next_code_point(s, i);
        ++n;
    }
    return n;
}

std::string first_char(const std::string& s) {
    if (s.empty()) return std::string();
    size_t i = 0;
    next_code_point(s, i);
    return s.substr(0, i);
}

std::string last_char(const std::string& s) {
    if (s.empty()) return std::string();
    size_t i = s.size() - 1;
    // Walk back over continuation bytes
    while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) --i;
    return s.substr(i);
}

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------

Script script_of(UChar32 cp) {
    UErrorCode status = U_ZERO_ERROR;
    UScriptCode sc = uscript_getScript(cp, &status);
    if (U_FAILURE(status)) return Script::Other;
    switch (sc) {
        case USCRIPT_LATIN:    return Script::Latin;
        case USCRIPT_ARABIC:   return Script::Arabic;
        case USCRIPT_CYRILLIC: return Script::Cyrillic;
        case USCRIPT_GREEK:    return Script::Greek;
        case USCRIPT_HAN:
        case USCRIPT_HIRAGANA:
        case USCRIPT_KATAKANA:
        case USCRIPT_HANGUL:   return Script::Cjk;
        case USCRIPT_COMMON:
        case USCRIPT_INHERITED: return Script::None;
        default:               return Script::Other;
    }
}

Script script_of(const std::string& s) {
    int counts[7] = {0, 0, 0, 0, 0, 0, 0};
    for (UChar32 c : decode(s)) {
        if (!is_letter(c)) continue;
        Script sc = script_of(c);
        if (sc == Script::None) continue;
        counts[static_cast<int>(sc)]++;
    }
    int best = 0;
    for (int k = 1; k < 7; ++k) {
        if (counts[k] > counts[best]) best = k;
    }
    return counts[best] > 0 ? static_cast<Script>(best) : Script::None;
}

bool is_letter(UChar32 cp) {
    return cp >= 0 && u_isalpha(cp);
}

bool is_mark(UChar32 cp) {
    if (cp < 0) return false;
    int8_t t = u_charType(cp);
    return t == U_NON_SPACING_MARK || t == U_COMBINING_SPACING_MARK ||
           t == U_ENCLOSING_MARK;
}

bool is_space(UChar32 cp) {
    return cp >= 0 && (cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' ||
                       cp == '\f' || cp == '\v' || u_isUWhiteSpace(cp));
}

bool is_word_start(UChar32 cp) {
    if (cp == kTatweel) return true;
    return is_letter(cp);
}

bool is_word_char(UChar32 cp) {
    if (is_word_start(cp) || is_mark(cp)) return true;
    if (cp == kZwnj || cp == kZwj || cp == '_') return true;
    return is_digit(cp);
}

int digit_value(UChar32 cp) {
    if (cp >= '0' && cp <= '9') return cp - '0';
    if (cp >= 0x0660 && cp <= 0x0669) return cp - 0x0660;
    if (cp >= 0x06F0 && cp <= 0x06F9) return cp - 0x06F0;
    return -1;
}

bool is_digit(UChar32 cp) {
    return digit_value(cp) >= 0;
}

bool is_arabic_diacritic(UChar32 cp) {
    return (cp >= 0x064B && cp <= 0x065F) || cp == 0x0670 ||
           (cp >= 0x06D6 && cp <= 0x06ED && cp != 0x06DD && cp != 0x06DE &&
            cp != 0x06E5 && cp != 0x06E6 && cp != 0x06E9);
}

bool has_arabic_diacritics(const std::string& s) {
    for (UChar32 c : decode(s)) {
        if (is_arabic_diacritic(c)) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// String helpers
// ---------------------------------------------------------------------------

std::string ascii_digits(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t start = i;
        UChar32 c = next_code_point(s, i);
        int d = digit_value(c);
        if (d >= 0) {
            out += static_cast<char>('0' + d);
        } else if (c == 0x066B) {
            out += '.';
        } else if (c == 0x066C) {
            out += ',';
        } else {
            out.append(s, start, i - start);
        }
    }
    return out;
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (UChar32 c : decode(s)) {
        if (!is_digit(c)) return false;
    }
    return true;
}

bool has_digit(const std::string& s) {
    for (UChar32 c : decode(s)) {
        if (is_digit(c)) return true;
    }
    return false;
}

std::string to_lower(const std::string& s) {
    std::string out;
    icu::UnicodeString::fromUTF8(s).toLower().toUTF8String(out);
    return out;
}

std::string to_upper(const std::string& s) {
    std::string out;
    icu::UnicodeString::fromUTF8(s).toUpper().toUTF8String(out);
    return out;
}

std::string fold_accents(const std::string& s) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    if (U_FAILURE(status)) return s;

    icu::UnicodeString decomposed =
        nfkd->normalize(icu::UnicodeString::fromUTF8(s), status);
    if (U_FAILURE(status)) return s;

    std::string utf8;
    decomposed.toUTF8String(utf8);

    std::string out;
    for (UChar32 c : decode(utf8)) {
        if (is_mark(c)) continue;
        if (c == 0x00DF || c == 0x1E9E) {   // sharp s
            out += (c == 0x1E9E) ? "SS" : "ss";
            continue;
        }
        out += encode(c);
    }
    return out;
}

std::string strip_joiners(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t start = i;
        UChar32 c = next_code_point(s, i);
        if (c == kTatweel || c == kZwnj || c == kZwj) continue;
        out.append(s, start, i - start);
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string remove_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    std::copy_if(s.begin(), s.end(), std::back_inserter(out),
                 [](char c) { return c != ' '; });
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty()) continue;
        if (!out.empty()) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace ckbtext::text
