#include <catch2/catch.hpp>
#include <ckbtext/modules/linguistics.hpp>
#include <ckbtext/modules/unit.hpp>
#include <ckbtext/pipeline.hpp>
#include <ckbtext/tokenizer.hpp>

using namespace ckbtext;

static TokenList tag_units(const std::string& input) {
    UnitTaggerModule tagger{Config()};
    auto tokens = tokenize(input);
    tagger.process(tokens);
    return tokens;
}

static TokenList run_units(const std::string& input) {
    Config cfg;
    UnitTaggerModule tagger(cfg);
    UnitModule units(cfg);
    auto tokens = tokenize(input);
    tagger.process(tokens);
    units.process(tokens);
    compact(tokens);
    return tokens;
}

// ===== Lookup =====

TEST_CASE("lookup_unit", "[units]") {
    auto km = lookup_unit("km");
    REQUIRE(km.has_value());
    REQUIRE(std::string(km->spoken) == "کیلۆمەتر");
    REQUIRE(km->strict);

    std::string suffix;
    auto with_suffix = lookup_unit("kgـەکە", &suffix);
    REQUIRE(with_suffix.has_value());
    REQUIRE(suffix == "ەکە");

    REQUIRE_FALSE(lookup_unit("kgـxyz").has_value());
    REQUIRE_FALSE(lookup_unit("hello").has_value());
}

// ===== Tagger =====

TEST_CASE("unit after a number is tagged", "[units][tagger]") {
    auto toks = tag_units("10 m");
    REQUIRE(toks[1].has_tag(tags::IsUnit));
}

TEST_CASE("unit-looking word in prose is not tagged", "[units][tagger]") {
    auto toks = tag_units("I am m");
    REQUIRE_FALSE(toks[2].has_tag(tags::IsUnit));
}

TEST_CASE("unit after a fraction is tagged", "[units][tagger]") {
    REQUIRE(tag_units("½ kg")[1].has_tag(tags::IsUnit));
    REQUIRE(tag_units("3/4 km")[3].has_tag(tags::IsUnit));

    TokenList spoken{Token("نیوە", TokenType::Number, " "), Token("kg", TokenType::Word)};
    spoken[0].is_converted = true;
    spoken[0].add_tag(tags::Fraction);
    UnitTaggerModule{Config()}.process(spoken);
    REQUIRE(spoken[1].has_tag(tags::IsUnit));

    REQUIRE(normalize_text("½ kg") == "نیوە کیلۆگرام");
    REQUIRE(normalize_text("3/4 km") == "سێ دابەش چوار کیلۆمەتر");
}

TEST_CASE("rate denominators are tagged", "[units][tagger]") {
    auto toks = tag_units("60 km/h");
    REQUIRE(toks[1].has_tag(tags::IsUnit));
    REQUIRE(toks[3].has_tag(tags::IsUnit));
}

TEST_CASE("script tagger labels words by script", "[tagger]") {
    ScriptTaggerModule tagger{Config()};
    auto toks = tokenize("Hello سڵاو Привет");
    tagger.process(toks);
    REQUIRE(toks[0].has_tag(tags::ScriptLatin));
    REQUIRE(toks[1].has_tag(tags::ScriptKurdish));
    REQUIRE(toks[2].has_tag(tags::ScriptCyrillic));
}

// ===== Normalizer =====

TEST_CASE("tagged units are spoken", "[units]") {
    auto toks = run_units("10 km");
    REQUIRE(toks[1].text == "کیلۆمەتر");
    REQUIRE(toks[1].has_tag(tags::UnitProcessed));
}

TEST_CASE("rates read as per-unit", "[units]") {
    auto toks = run_units("60 km/h");
    REQUIRE(toks.size() == 2);
    REQUIRE(toks[1].text == "کیلۆمەتر بۆ ھەر کاتژمێرێک");
}

TEST_CASE("squared and cubed units", "[units]") {
    REQUIRE(run_units("5 m²")[1].text == "مەتر دووجا");
    REQUIRE(run_units("5 m^3")[1].text == "مەتر سێجا");
    REQUIRE(run_units("5 m^3").size() == 2);
}

TEST_CASE("half amounts move the half after the unit", "[units]") {
    auto toks = run_units("2.5 km");
    REQUIRE(toks[0].text == "دوو");
    REQUIRE(toks[1].text == "کیلۆمەتر و نیو");
}

TEST_CASE("units through the pipeline", "[units][pipeline]") {
    REQUIRE(normalize_text("10 km") == "دە کیلۆمەتر");
    REQUIRE(normalize_text("60 km/h") == "شەست کیلۆمەتر بۆ ھەر کاتژمێرێک");
    REQUIRE(normalize_text("5 m²") == "پێنج مەتر دووجا");
}
