#include <catch2/catch.hpp>
#include <ckbtext/modules/currency.hpp>
#include <ckbtext/pipeline.hpp>
#include <ckbtext/tokenizer.hpp>

using namespace ckbtext;

static TokenList run_currency(const std::string& input) {
    CurrencyModule module{Config()};
    auto tokens = tokenize(input);
    module.process(tokens);
    compact(tokens);
    return tokens;
}

TEST_CASE("amount followed by a sign", "[currency]") {
    auto toks = run_currency("100 $");
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].text == "سەد دۆلار");
    REQUIRE(toks[0].has_tag(tags::Currency));
}

TEST_CASE("sign followed by an amount", "[currency]") {
    REQUIRE(run_currency("$ 50")[0].text == "پەنجا دۆلار");
    REQUIRE(run_currency("$50")[0].text == "پەنجا دۆلار");
}

TEST_CASE("decimals become subunits", "[currency]") {
    auto toks = run_currency("$ 12.50");
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].text == "دوازدە دۆلار و پەنجا سەنت");

    REQUIRE(run_currency("€5.5")[0].text == "پێنج یۆرۆ و پەنجا سەنت");
    REQUIRE(run_currency("$3.00")[0].text == "سێ دۆلار");
}

TEST_CASE("currency codes and the Iraqi dinar abbreviation", "[currency]") {
    REQUIRE(run_currency("25000 IQD")[0].text == "بیست و پێنج ھەزار دینار");

    auto abbrev = run_currency("5000 د.ع");
    REQUIRE(abbrev.size() == 1);
    REQUIRE(abbrev[0].text == "پێنج ھەزار دینار");
}

TEST_CASE("currency without a subunit reads the decimal", "[currency]") {
    REQUIRE(run_currency("¥ 1.5")[0].text == "یەک پۆینت پێنج ین");
}

TEST_CASE("lone sign is named", "[currency]") {
    auto toks = run_currency("نرخی $ بەرزە");
    REQUIRE(toks[1].text == "دۆلار");
}

TEST_CASE("lookup_currency", "[currency]") {
    REQUIRE(lookup_currency("GBP") != nullptr);
    REQUIRE(std::string(lookup_currency("£")->subunit) == "پێنس");
    REQUIRE(lookup_currency("XYZ") == nullptr);
}

TEST_CASE("currency through the pipeline", "[currency][pipeline]") {
    REQUIRE(normalize_text("100 $") == "سەد دۆلار");
    REQUIRE(normalize_text("$ 12.50") == "دوازدە دۆلار و پەنجا سەنت");
}
