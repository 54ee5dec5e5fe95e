#pragma once

#include <ckbtext/module.hpp>
#include <string>
#include <vector>

namespace ckbtext {

// Reads PHONE tokens (and spaced local numbers "0750 123 45 67") in digit
// groups.
class PhoneModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "phone"; }
    int priority() const override { return 98; }
    void process(TokenList& tokens) const override;

    // Digit groups of a phone number: 4-3-2-2 for local numbers; "+",
    // country code, then threes ending in 2-2 for international ones
    static std::vector<std::string> group_digits(const std::string& number);

    std::string speak(const std::string& number) const;
};

} // namespace ckbtext
