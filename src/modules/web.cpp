#include <ckbtext/modules/web.hpp>
#include <ckbtext/transliterate.hpp>

namespace ckbtext {

void WebModule::process(TokenList& tokens) const {
    for (auto& t : tokens) {
        if (t.is_converted) continue;
        if (t.type != TokenType::Url && t.type != TokenType::Email) continue;

        std::string spoken = spell_out(t.text);
        if (spoken.empty()) continue;
        t.rewrite(spoken);
        t.add_tag(tags::SpelledOut);
    }
}

} // namespace ckbtext
