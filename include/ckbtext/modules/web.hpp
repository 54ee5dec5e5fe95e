#pragma once

#include <ckbtext/module.hpp>

namespace ckbtext {

// Spells URL and EMAIL tokens: separators by name, known web words whole,
// other letter runs transliterated and digit runs as numbers.
class WebModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "web"; }
    int priority() const override { return 100; }
    void process(TokenList& tokens) const override;
};

} // namespace ckbtext
