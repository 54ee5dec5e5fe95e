#pragma once

#include <ckbtext/token.hpp>
#include <string>

namespace ckbtext {

// Lex UTF-8 text into tokens. Rigid patterns are tried first (URL, e-mail,
// phone, date, time, number, #tag/@mention, sub/superscript), then the
// generic WORD and single-character SYMBOL fallbacks, so lexing never fails.
//
// Whitespace is attached to the preceding token; whitespace at the very
// start of the input is carried by a leading Unknown token.
TokenList tokenize(const std::string& text);

// Concatenate text + whitespace_after of every live token. The exact inverse
// of tokenize() on an unmodified list.
std::string detokenize(const TokenList& tokens);

} // namespace ckbtext
