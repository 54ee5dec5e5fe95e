#pragma once

#include <ckbtext/module.hpp>

namespace ckbtext {

// Removes, names or ignores emoji according to Config::emoji
class EmojiModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "emoji"; }
    int priority() const override { return 50; }
    void process(TokenList& tokens) const override;
};

} // namespace ckbtext
