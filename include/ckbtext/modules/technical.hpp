#pragma once

#include <ckbtext/module.hpp>
#include <string>

namespace ckbtext {

// #hashtags, @mentions, alphanumeric codes ("A1", "x86_64") and tight
// code-code pairs
class TechnicalModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "technical"; }
    int priority() const override { return 90; }
    void process(TokenList& tokens) const override;

    // Letters mixed with digits or joined by '_' / '-', excluding math
    // functions, currency codes and unit codes
    static bool is_code(const std::string& word);
};

} // namespace ckbtext
