#include <catch2/catch.hpp>
#include <ckbtext/modules/transliteration.hpp>
#include <ckbtext/transliterate.hpp>

using namespace ckbtext;

static std::string run_transliteration(const std::string& word,
                                       TokenType type = TokenType::Word) {
    TokenList toks{Token(word, type)};
    TransliterationModule{Config()}.process(toks);
    return toks[0].text;
}

TEST_CASE("dictionary words", "[transliteration]") {
    REQUIRE(run_transliteration("Phone") == "فۆن");
    REQUIRE(run_transliteration("hello") == "ھێلۆ");
}

TEST_CASE("rule-based fallback", "[transliteration]") {
    REQUIRE(run_transliteration("Razwan") == "ڕازوان");
    REQUIRE(latin_to_kurdish("razwan") == "ڕازوان");
}

TEST_CASE("Cyrillic is romanized first", "[transliteration]") {
    REQUIRE(run_transliteration("Путин") == "پوتین");
}

TEST_CASE("acronyms are spelled", "[transliteration]") {
    REQUIRE(is_acronym("UK"));
    REQUIRE_FALSE(is_acronym("NATIONAL"));
    REQUIRE(run_transliteration("UK") == "یو کەی");
}

TEST_CASE("Arabic-script suffix is kept", "[transliteration]") {
    REQUIRE(transliterate_word("UKم") == "یو کەیم");
}

TEST_CASE("technical and native tokens are untouched", "[transliteration]") {
    REQUIRE(run_transliteration("User", TokenType::Technical) == "User");
    REQUIRE(run_transliteration("سڵاو") == "سڵاو");
    REQUIRE_FALSE(has_foreign_letters("سڵاو"));
    REQUIRE(has_foreign_letters("Hello"));
}
