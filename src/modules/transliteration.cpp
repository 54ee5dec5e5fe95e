#include <ckbtext/modules/transliteration.hpp>
#include <ckbtext/transliterate.hpp>

namespace ckbtext {

void TransliterationModule::process(TokenList& tokens) const {
    for (auto& t : tokens) {
        if (t.is_dead() || t.is_converted || t.type != TokenType::Word) continue;
        if (!has_foreign_letters(t.text)) continue;

        std::string spoken = transliterate_word(t.text);
        if (spoken != t.text) t.rewrite(spoken);
    }
}

} // namespace ckbtext
