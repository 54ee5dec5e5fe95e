#pragma once

#include <ckbtext/module.hpp>

namespace ckbtext {

// Surrounds converted tokens with whitespace, except after an opening
// bracket or quote
class SpacingModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "spacing"; }
    int priority() const override { return 0; }
    void process(TokenList& tokens) const override;
};

} // namespace ckbtext
