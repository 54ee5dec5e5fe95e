#pragma once

#include <ckbtext/module.hpp>

namespace ckbtext {

// Attaches a suffix word ("ـەکە", "ی") to the converted token it is glued to
class GrammarModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "grammar"; }
    int priority() const override { return 28; }
    void process(TokenList& tokens) const override;
};

} // namespace ckbtext
