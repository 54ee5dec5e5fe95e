#pragma once

#include <string>

namespace ckbtext {

// Letter-by-letter English names ("UK" -> "یو کەی")
std::string spell_letters(const std::string& word);

// All-uppercase Latin word of at most five letters
bool is_acronym(const std::string& word);

// Rule-based Latin -> Kurdish rendering of a lowercase ASCII word:
// digraphs, the word-initial vowel seat ئ and word-initial r -> ڕ
std::string latin_to_kurdish(const std::string& word);

// Full foreign-word rendering: dictionary, acronyms, accent folding,
// Cyrillic/Greek romanization, then the Latin rules. A trailing
// Arabic-script suffix ("UKم", "Приветـیشمان") is kept. Words with no
// Latin, Cyrillic or Greek letters are returned unchanged.
std::string transliterate_word(const std::string& word);

// True if the word holds a Latin, Cyrillic or Greek letter
bool has_foreign_letters(const std::string& word);

// Spoken form of an identifier, URL or e-mail address: separators by
// name, digit runs as numbers, short letter runs by letter name and
// longer runs transliterated.
std::string spell_out(const std::string& code);

} // namespace ckbtext
