#include <catch2/catch.hpp>
#include <ckbtext/modules/technical.hpp>
#include <ckbtext/modules/web.hpp>
#include <ckbtext/transliterate.hpp>
#include <ckbtext/tokenizer.hpp>

using namespace ckbtext;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ===== Web =====

TEST_CASE("URLs are spelled with separator names", "[web]") {
    TokenList toks{Token("www.rudaw.net", TokenType::Url)};
    WebModule{Config()}.process(toks);
    REQUIRE(toks[0].is_converted);
    REQUIRE(toks[0].has_tag(tags::SpelledOut));
    REQUIRE(contains(toks[0].text, "دەبڵیو"));
    REQUIRE(contains(toks[0].text, "دۆت نێت"));
}

TEST_CASE("e-mail addresses are spelled", "[web]") {
    TokenList toks{Token("user@gmail.com", TokenType::Email)};
    WebModule{Config()}.process(toks);
    REQUIRE(contains(toks[0].text, "ئەت جیمەیڵ"));
    REQUIRE(contains(toks[0].text, "یوسەر"));
    REQUIRE(contains(toks[0].text, "دۆت کۆم"));
}

TEST_CASE("web module leaves plain words alone", "[web]") {
    TokenList toks{Token("rudaw", TokenType::Word)};
    WebModule{Config()}.process(toks);
    REQUIRE_FALSE(toks[0].is_converted);
}

TEST_CASE("spell_out separators and digit runs", "[web]") {
    REQUIRE(spell_out("a_b") == "ئەی ئەندەرسکۆڕ بی");
    REQUIRE(spell_out("x/12") == "ئێکس سلاش دوازدە");
    REQUIRE(spell_out("007") == "سفر سفر حەوت");
}

// ===== Technical =====

TEST_CASE("hashtags, mentions and codes", "[technical]") {
    TokenList toks{
        Token("#Kurdistan", TokenType::Technical, " "),
        Token("@Razwan", TokenType::Technical, " "),
        Token("A1", TokenType::Word),
    };
    TechnicalModule{Config()}.process(toks);
    REQUIRE(contains(toks[0].text, "ھاشتاگ"));
    REQUIRE(contains(toks[1].text, "ئەت"));
    REQUIRE(contains(toks[2].text, "ئەی"));
    REQUIRE(contains(toks[2].text, "یەک"));
    REQUIRE(toks[2].has_tag(tags::SpelledOut));
}

TEST_CASE("is_code", "[technical]") {
    REQUIRE(TechnicalModule::is_code("A1"));
    REQUIRE(TechnicalModule::is_code("user_id"));
    REQUIRE_FALSE(TechnicalModule::is_code("hello"));
    REQUIRE_FALSE(TechnicalModule::is_code("123"));
    REQUIRE_FALSE(TechnicalModule::is_code("km"));
}

TEST_CASE("tight code-dash-code triples are bound", "[technical]") {
    auto toks = tokenize("A-1");
    TechnicalModule{Config()}.process(toks);
    REQUIRE(toks[0].text == "ئەی");
    REQUIRE(toks[1].text == "داش");
    REQUIRE(toks[2].text == "یەک");
}

TEST_CASE("number ranges are left to the math pass", "[technical]") {
    auto toks = tokenize("10-20");
    TechnicalModule{Config()}.process(toks);
    REQUIRE(toks[1].text == "-");
    REQUIRE_FALSE(toks[1].is_converted);
}
