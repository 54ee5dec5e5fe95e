#include <ckbtext/modules/currency.hpp>
#include <ckbtext/numbers.hpp>
#include <ckbtext/text.hpp>
#include <unordered_map>

namespace ckbtext {

namespace {

const CurrencyInfo kDollar{"دۆلار", "سەنت"};
const CurrencyInfo kEuro{"یۆرۆ", "سەنت"};
const CurrencyInfo kPound{"پاوەند", "پێنس"};
const CurrencyInfo kYen{"ین", nullptr};
const CurrencyInfo kDinar{"دینار", "فلس"};
const CurrencyInfo kDirham{"دیرھەم", "فلس"};
const CurrencyInfo kLira{"لیرە", "قورووش"};
const CurrencyInfo kRial{"ڕیاڵ", nullptr};
const CurrencyInfo kKuwaitiDinar{"دیناری کوەیتی", "فلس"};
const CurrencyInfo kSaudiRiyal{"ڕیاڵی سعوودی", "ھەڵەڵە"};
const CurrencyInfo kAustralianDollar{"دۆلاری ئوسترالی", "سەنت"};
const CurrencyInfo kCanadianDollar{"دۆلاری کەنەدی", "سەنت"};

const char* const kIraqiDinarAbbrev = "د.ع";

bool is_sign(const std::string& s) {
    return s == "$" || s == "€" || s == "£" || s == "¥" || s == kIraqiDinarAbbrev;
}

// Currency at token i; `span` receives how many tokens it covers ("د.ع" is
// lexed as three tight tokens)
const CurrencyInfo* currency_at(const TokenList& tokens, size_t i, size_t& span,
                                std::string& surface) {
    span = 1;
    const Token& t = tokens[i];
    if (t.is_dead() || t.is_converted) return nullptr;
    surface = t.text;
    if (const CurrencyInfo* c = lookup_currency(t.text)) return c;

    if (t.text == "د" && i + 2 < tokens.size() && is_tight(t) && is_tight(tokens[i + 1]) &&
        tokens[i + 1].text == "." && tokens[i + 2].text == "ع") {
        span = 3;
        surface = kIraqiDinarAbbrev;
        return lookup_currency(kIraqiDinarAbbrev);
    }
    return nullptr;
}

bool is_amount(const Token& t) {
    return t.type == TokenType::Number && !t.is_converted && split_number(t.text).has_value();
}

} // anonymous namespace

const CurrencyInfo* lookup_currency(const std::string& symbol) {
    static const std::unordered_map<std::string, const CurrencyInfo*> table = {
        {"$", &kDollar}, {"USD", &kDollar},
        {"€", &kEuro}, {"EUR", &kEuro},
        {"£", &kPound}, {"GBP", &kPound},
        {"¥", &kYen}, {"JPY", &kYen},
        {"IQD", &kDinar}, {kIraqiDinarAbbrev, &kDinar},
        {"AED", &kDirham},
        {"TRY", &kLira},
        {"IRR", &kRial},
        {"KWD", &kKuwaitiDinar},
        {"SAR", &kSaudiRiyal},
        {"AUD", &kAustralianDollar},
        {"CAD", &kCanadianDollar},
    };
    auto it = table.find(symbol);
    return it == table.end() ? nullptr : it->second;
}

std::string CurrencyModule::speak_amount(const std::string& number, const CurrencyInfo& c) const {
    auto parts = split_number(number);
    if (!parts || parts->has_exponent) {
        NumberReadingOptions opts{config().scientific_low, config().scientific_high};
        return number_to_words(number, opts).value_or(number) + " " + c.name;
    }

    std::string whole = integer_to_words(parts->integer.empty() ? "0" : parts->integer);
    std::string spoken = whole + " " + c.name;

    if (!parts->fraction.empty()) {
        if (c.subunit) {
            std::string cents = parts->fraction.substr(0, 2);
            if (cents.size() == 1) cents += '0';
            if (cents != "00") {
                spoken += std::string(" و ") + integer_to_words(cents) + " " + c.subunit;
            }
        } else {
            spoken = integer_to_words(parts->integer.empty() ? "0" : parts->integer) + " " +
                     words::Point + " " + zero_padded_to_words(parts->fraction) + " " + c.name;
        }
    }
    if (parts->negative) spoken = std::string(words::Minus) + " " + spoken;
    return spoken;
}

void CurrencyModule::process(TokenList& tokens) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || t.is_converted) continue;

        size_t span = 0;
        std::string surface;

        // Amount then currency: "100 $", "25000 IQD"
        if (is_amount(t) && i + 1 < tokens.size()) {
            if (const CurrencyInfo* c = currency_at(tokens, i + 1, span, surface)) {
                t.rewrite(speak_amount(t.text, *c));
                t.add_tag(tags::Currency);
                t.whitespace_after = tokens[i + span].whitespace_after;
                for (size_t k = i + 1; k <= i + span; ++k) tokens[k].erase();
                i += span;
                continue;
            }
        }

        const CurrencyInfo* c = currency_at(tokens, i, span, surface);
        if (!c) continue;

        // Currency then amount: "$ 50", "$50"
        if (i + span < tokens.size() && is_amount(tokens[i + span])) {
            Token& amount = tokens[i + span];
            amount.rewrite(speak_amount(amount.text, *c));
            amount.add_tag(tags::Currency);
            for (size_t k = i; k < i + span; ++k) tokens[k].erase();
            i += span;
            continue;
        }

        // Lone sign
        if (is_sign(surface)) {
            t.rewrite(c->name);
            t.add_tag(tags::Currency);
            t.whitespace_after = tokens[i + span - 1].whitespace_after;
            for (size_t k = i + 1; k < i + span; ++k) tokens[k].erase();
            i += span - 1;
        }
    }
}

} // namespace ckbtext
