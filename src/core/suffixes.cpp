#include <ckbtext/suffixes.hpp>
#include <ckbtext/text.hpp>
#include <algorithm>

namespace ckbtext {

const std::vector<std::string>& grammar_suffixes() {
    static const std::vector<std::string> table = [] {
        std::vector<std::string> v = {
            "ەکانیش", "ەکانی", "ەکان", "ەکەیش", "ەکەی", "ەکەش", "ەکە",
            "یەکان", "یەکە", "یەک", "ێکی", "ێک",
            "ەکاندا", "ەکەدا", "ەوە", "یەوە", "وە",
            "یشی", "یش", "ش", "یە", "ە", "ی",
            "یان", "مان", "تان", "ان", "دا", "یدا", "ین", "م", "ت",
        };
        std::stable_sort(v.begin(), v.end(), [](const std::string& a, const std::string& b) {
            return text::length(a) > text::length(b);
        });
        return v;
    }();
    return table;
}

bool is_grammar_suffix(const std::string& s) {
    const auto& table = grammar_suffixes();
    return std::find(table.begin(), table.end(), s) != table.end();
}

std::string strip_leading_joiners(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t next = i;
        UChar32 c = text::next_code_point(s, next);
        if (c != text::kTatweel && c != text::kZwnj && c != text::kZwj) break;
        i = next;
    }
    return s.substr(i);
}

bool ends_with_vowel(const std::string& s) {
    static const char* const vowels[] = {"وو", "و", "ی", "ێ", "ا", "ە", "ۆ"};
    for (const char* v : vowels) {
        if (text::ends_with(s, v)) return true;
    }
    return false;
}

std::string append_suffix(const std::string& spoken, const std::string& suffix) {
    if (suffix.empty()) return spoken;
    if (ends_with_vowel(spoken)) {
        if (suffix == "ە") return spoken + "یە";
        if (suffix == "ەکە" || suffix == "ەکان") return spoken + "ی" + suffix;
    }
    return spoken + suffix;
}

} // namespace ckbtext
