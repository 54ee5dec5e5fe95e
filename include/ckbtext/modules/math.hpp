#pragma once

#include <ckbtext/module.hpp>
#include <string>

namespace ckbtext {

class MathModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "math"; }
    int priority() const override { return 80; }
    void process(TokenList& tokens) const override;

    // "نیوە", "و نیو", "{n} دابەش {d}", "ژمارەی تەواو و {n} لەسەر {d}", ...
    static std::string speak_fraction(long long num, long long den, bool mixed);

    static bool is_strict_unit(const std::string& word);

    // ½, ¾, ⅓ ... as a single token
    static bool is_unicode_fraction(const std::string& s);
};

} // namespace ckbtext
