#pragma once

#include <ckbtext/module.hpp>

namespace ckbtext {

class TransliterationModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "transliteration"; }
    int priority() const override { return 20; }
    void process(TokenList& tokens) const override;
};

} // namespace ckbtext
