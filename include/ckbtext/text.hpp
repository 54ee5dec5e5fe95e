#pragma once

#include <ckbtext/result.hpp>
#include <unicode/umachine.h>
#include <string>
#include <vector>

namespace ckbtext::text {

// ---------------------------------------------------------------------------
// UTF-8 decoding / encoding (ICU U8_* macros)
// ---------------------------------------------------------------------------

// Decode the code point starting at byte offset `i` and advance `i` past it.
// Malformed sequences yield a negative value and advance by at least one byte.
UChar32 next_code_point(const std::string& s, size_t& i);

// Ok for well-formed UTF-8; otherwise an Encoding error located at the
// first malformed byte
Status check_utf8(const std::string& s);

std::vector<UChar32> decode(const std::string& s);
std::string encode(UChar32 cp);
std::string encode(const std::vector<UChar32>& cps);

// Each code point as its own UTF-8 string
std::vector<std::string> split_chars(const std::string& s);

// Number of code points
size_t length(const std::string& s);

std::string first_char(const std::string& s);
std::string last_char(const std::string& s);

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------

enum class Script { None, Latin, Arabic, Cyrillic, Greek, Cjk, Other };

Script script_of(UChar32 cp);

// Dominant script of a string, ignoring digits, marks and joiners
Script script_of(const std::string& s);

bool is_letter(UChar32 cp);
bool is_mark(UChar32 cp);
bool is_space(UChar32 cp);

// Can start / continue a WORD token
bool is_word_start(UChar32 cp);
bool is_word_char(UChar32 cp);

// ASCII, Arabic-Indic or Extended Arabic-Indic digit value; -1 otherwise
int digit_value(UChar32 cp);
bool is_digit(UChar32 cp);

// Arabic harakat, tanween, superscript alef and Quranic annotation marks
bool is_arabic_diacritic(UChar32 cp);
bool has_arabic_diacritics(const std::string& s);

constexpr UChar32 kTatweel = 0x0640;
constexpr UChar32 kZwnj = 0x200C;
constexpr UChar32 kZwj = 0x200D;

// ---------------------------------------------------------------------------
// String helpers
// ---------------------------------------------------------------------------

// Eastern digits to ASCII, Arabic decimal/thousands separators to '.'/','
std::string ascii_digits(const std::string& s);

// True if the string is non-empty and made only of digits (any of the
// supported digit sets)
bool is_all_digits(const std::string& s);
bool has_digit(const std::string& s);

std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// NFKD + drop combining marks; also expands sharp s
std::string fold_accents(const std::string& s);

// Remove tatweel and zero-width joiners
std::string strip_joiners(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
void replace_all(std::string& s, const std::string& from, const std::string& to);
std::string trim(const std::string& s);
std::string remove_spaces(const std::string& s);

// Empty parts are skipped
std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace ckbtext::text
