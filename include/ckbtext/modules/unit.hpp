#pragma once

#include <ckbtext/module.hpp>
#include <optional>
#include <string>

namespace ckbtext {

struct UnitInfo {
    const char* spoken;
    bool strict;    // single/double-letter symbols that are never variables
};

// Known unit for a WORD's lowercase form; a tatweel-attached suffix is
// reported in `suffix`
std::optional<UnitInfo> lookup_unit(const std::string& word, std::string* suffix = nullptr);

// Tags unit words in numeric context with IS_UNIT
class UnitTaggerModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "unit-tagger"; }
    int priority() const override { return 85; }
    void process(TokenList& tokens) const override;
};

// Speaks IS_UNIT tokens, unit/unit rates and squared/cubed units
class UnitModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "unit"; }
    int priority() const override { return 70; }
    void process(TokenList& tokens) const override;
};

} // namespace ckbtext
