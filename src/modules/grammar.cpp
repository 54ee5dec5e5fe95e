#include <ckbtext/modules/grammar.hpp>
#include <ckbtext/suffixes.hpp>

namespace ckbtext {

void GrammarModule::process(TokenList& tokens) const {
    for (size_t i = 1; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || t.is_converted || t.type != TokenType::Word) continue;

        Token* host = prev_live(tokens, i);
        if (!host || !host->is_converted || !is_tight(*host)) continue;

        std::string suffix = strip_leading_joiners(t.text);
        if (!is_grammar_suffix(suffix)) continue;

        host->text = append_suffix(host->text, suffix);
        host->whitespace_after = t.whitespace_after;
        t.erase();
    }
}

} // namespace ckbtext
