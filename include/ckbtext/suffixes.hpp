#pragma once

#include <string>
#include <vector>

namespace ckbtext {

// Closed table of Sorani grammatical suffixes, longest first
const std::vector<std::string>& grammar_suffixes();

bool is_grammar_suffix(const std::string& s);

// Remove a leading tatweel / ZWNJ / ZWJ ("ـەکە" -> "ەکە")
std::string strip_leading_joiners(const std::string& s);

// Ends in one of the Sorani vowels وو و ی ێ ا ە ۆ
bool ends_with_vowel(const std::string& s);

// Attach a grammatical suffix to spoken text. After a vowel, "ە" becomes
// "یە" and "ەکە" / "ەکان" gain a linking "ی".
std::string append_suffix(const std::string& spoken, const std::string& suffix);

} // namespace ckbtext
