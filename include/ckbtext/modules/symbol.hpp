#pragma once

#include <ckbtext/module.hpp>

namespace ckbtext {

class SymbolModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "symbol"; }
    int priority() const override { return 40; }
    void process(TokenList& tokens) const override;
};

} // namespace ckbtext
