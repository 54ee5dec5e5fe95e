#pragma once

#include <unicode/umachine.h>
#include <optional>
#include <string>

namespace ckbtext::lexicon {

// English name of a Latin letter, case-insensitive ("a" -> "ئەی");
// nullptr for anything else
const char* letter_name(UChar32 c);

// Spoken name of a Greek letter, either case ("π" -> "پای")
const char* greek_letter_name(UChar32 c);

// Whole-word pronunciations for common English and web vocabulary,
// keyed by lowercase form
std::optional<std::string> english_word(const std::string& lower);

// Latin rendering of a Cyrillic or Greek letter; nullptr otherwise
const char* romanize(UChar32 c);

} // namespace ckbtext::lexicon
