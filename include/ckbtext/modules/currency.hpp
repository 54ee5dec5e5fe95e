#pragma once

#include <ckbtext/module.hpp>
#include <string>

namespace ckbtext {

struct CurrencyInfo {
    const char* name;
    const char* subunit;    // nullptr when not spoken
};

// `$`, `€`, `£`, `¥`, `د.ع` or an ISO code; nullptr otherwise
const CurrencyInfo* lookup_currency(const std::string& symbol);

class CurrencyModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "currency"; }
    int priority() const override { return 75; }
    void process(TokenList& tokens) const override;

    // "12.50" + dollar -> "دوازدە دۆلار و پەنجا سەنت"
    std::string speak_amount(const std::string& number, const CurrencyInfo& c) const;
};

} // namespace ckbtext
