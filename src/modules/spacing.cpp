#include <ckbtext/modules/spacing.hpp>

namespace ckbtext {

namespace {

bool is_opener(const std::string& s) {
    return s == "(" || s == "[" || s == "{" || s == "”" || s == "“" ||
           s == "\"" || s == "«";
}

} // anonymous namespace

void SpacingModule::process(TokenList& tokens) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || !t.is_converted) continue;

        if (i + 1 < tokens.size()) ensure_space_after(t);
        if (i > 0) {
            Token& prev = tokens[i - 1];
            if (prev.type != TokenType::Unknown && !is_opener(prev.text)) {
                ensure_space_after(prev);
            }
        }
    }
}

} // namespace ckbtext
