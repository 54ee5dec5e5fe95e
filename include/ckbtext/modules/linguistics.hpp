#pragma once

#include <ckbtext/module.hpp>
#include <string>

namespace ckbtext {

// Tags every WORD with SCRIPT_* by dominant script
class ScriptTaggerModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "script-tagger"; }
    int priority() const override { return 30; }
    void process(TokenList& tokens) const override;
};

// Character canonicalization, abbreviation expansion and common Arabic
// names in Kurdish spelling
class LinguisticsModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "linguistics"; }
    int priority() const override { return 25; }
    void process(TokenList& tokens) const override;

    // ك->ک, ي/ى->ی, ة->ە, ه->ھ (not word-final), tatweel/ZWJ removal
    static std::string canonicalize(const std::string& word);
};

} // namespace ckbtext
