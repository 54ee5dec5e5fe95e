#pragma once

#include <ckbtext/module.hpp>

namespace ckbtext {

class NumberModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "number"; }
    int priority() const override { return 60; }
    void process(TokenList& tokens) const override;
};

} // namespace ckbtext
