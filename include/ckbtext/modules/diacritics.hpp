#pragma once

#include <ckbtext/module.hpp>
#include <string>

namespace ckbtext {

// Harakat / tajweed handling for voweled Arabic-script words.
//
// In convert mode words are processed left to right and the vowel that
// ended the previous word is carried into the next one, so the lam of the
// divine name and ra can be resolved across word boundaries.
class DiacriticsModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "diacritics"; }
    int priority() const override { return 35; }
    void process(TokenList& tokens) const override;

    enum class Vowel { None, Fatha, Kasra, Damma };

    struct WordContext {
        bool utterance_start = true;
        Vowel previous = Vowel::None;    // last vowel of the previous word
        std::string next_word;           // for nasal assimilation lookahead
    };

    // Convert one word; `ctx.previous` is updated to this word's last vowel
    std::string convert_word(const std::string& word, WordContext& ctx) const;

    static std::string strip_marks(const std::string& word);
};

} // namespace ckbtext
