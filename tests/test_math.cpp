#include <catch2/catch.hpp>
#include <ckbtext/modules/math.hpp>
#include <ckbtext/pipeline.hpp>
#include <ckbtext/tokenizer.hpp>

using namespace ckbtext;

static TokenList run_math(const std::string& input) {
    MathModule module{Config()};
    auto tokens = tokenize(input);
    module.process(tokens);
    compact(tokens);
    return tokens;
}

// ===== Operators =====

TEST_CASE("binary operators are spoken", "[math]") {
    auto toks = run_math("5 + 3");
    REQUIRE(toks.size() == 3);
    REQUIRE(toks[1].text == "کۆ");
    REQUIRE(toks[1].has_tag(tags::MathOperator));

    REQUIRE(run_math("6 * 7")[1].text == "کەڕەتی");
    REQUIRE(run_math("8 = 8")[1].text == "یەکسانە بە");
}

TEST_CASE("unary minus at the start", "[math]") {
    auto toks = run_math("-5");
    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].text == "سالب");
    REQUIRE(toks[1].type == TokenType::Number);
}

TEST_CASE("dash between isolated numbers is a range", "[math]") {
    auto toks = run_math("10 - 20");
    REQUIRE(toks[1].text == "بۆ");
}

TEST_CASE("dash inside an expression chain is subtraction", "[math]") {
    auto toks = run_math("5 + 3 - 2");
    REQUIRE(toks[3].text == "کەم");
}

TEST_CASE("plus between words means with", "[math]") {
    auto toks = run_math("سێو + پرتەقاڵ");
    REQUIRE(toks[1].text == "لەگەڵ");
}

// ===== Fractions =====

TEST_CASE("simple fractions merge into one token", "[math]") {
    auto half = run_math("1/2");
    REQUIRE(half.size() == 1);
    REQUIRE(half[0].text == "نیوە");
    REQUIRE(half[0].has_tag(tags::Fraction));

    auto quarter = run_math("1/4");
    REQUIRE(quarter.size() == 1);
    REQUIRE(quarter[0].text == "چارەک");

    auto other = run_math("3/7");
    REQUIRE(other[0].text == "سێ دابەش حەوت");
}

TEST_CASE("mixed numbers", "[math]") {
    auto toks = run_math("2 1/2");
    REQUIRE(toks.size() == 2);
    REQUIRE(toks[1].text == "و نیو");
}

TEST_CASE("division inside a chain is not a fraction", "[math]") {
    auto toks = run_math("4 * 6 / 2");
    REQUIRE(toks.size() == 5);
    REQUIRE(toks[3].text == "دابەش");
}

TEST_CASE("speak_fraction", "[math]") {
    REQUIRE(MathModule::speak_fraction(1, 2, false) == "نیوە");
    REQUIRE(MathModule::speak_fraction(1, 4, true) == "و چارەک");
    REQUIRE(MathModule::speak_fraction(2, 3, false) == "دوو دابەش سێ");
}

TEST_CASE("unicode vulgar fractions", "[math]") {
    auto toks = run_math("½");
    REQUIRE(toks[0].text == "نیوە");
    auto mixed = run_math("3¾");
    REQUIRE(mixed[1].has_tag(tags::Fraction));
}

// ===== Terms =====

TEST_CASE("variables next to operators are spelled", "[math]") {
    auto toks = run_math("x + y");
    REQUIRE(toks[0].text == "ئێکس");
    REQUIRE(toks[0].has_tag(tags::MathTerm));
    REQUIRE(toks[1].text == "کۆ");
    REQUIRE(toks[2].text == "وای");
}

TEST_CASE("single-letter variables bind to spaced numbers", "[math]") {
    auto times = run_math("3 x 4");
    REQUIRE(times[1].text == "ئێکس");
    REQUIRE(times[1].has_tag(tags::MathTerm));

    auto sum = run_math("2 a + b");
    REQUIRE(sum[1].text == "ئەی");
    REQUIRE(sum[2].text == "کۆ");
    REQUIRE(sum[3].text == "بی");

    // Two-letter words need the number glued on
    REQUIRE_FALSE(run_math("5 ab")[1].is_converted);
    REQUIRE(run_math("5ab")[1].text == "ئەی بی");

    REQUIRE(normalize_text("3 x 4") == "سێ ئێکس چوار");
    REQUIRE(normalize_text("2 a + b") == "دوو ئەی کۆ بی");
}

TEST_CASE("units are never variables", "[math]") {
    auto toks = run_math("5 + 3 km");
    REQUIRE(toks[3].text == "km");
    REQUIRE_FALSE(MathModule::is_strict_unit("x"));
    REQUIRE(MathModule::is_strict_unit("KG"));
}

TEST_CASE("scripts, functions and Greek letters", "[math]") {
    auto power = run_math("x²");
    REQUIRE(power[0].text == "ئێکس");
    REQUIRE(power[1].text == "توان دوو");

    auto base = run_math("H₂");
    REQUIRE(base[1].text == "بنچینە دوو");

    REQUIRE(run_math("sin")[0].text == "ساینی");
    REQUIRE(run_math("π")[0].text == "پای");
}

TEST_CASE("math brackets are spoken, prose brackets left alone", "[math]") {
    auto toks = run_math("(5+3) - 2");
    REQUIRE(toks[0].text == "کەوانە");
    REQUIRE(toks[4].text == "کەوانە داخستن");
    REQUIRE(toks[5].text == "کەم");

    auto prose = run_math("(سڵاو)");
    REQUIRE(prose[0].text == "(");
}

// ===== End to end =====

TEST_CASE("operator chain through the pipeline", "[math][pipeline]") {
    REQUIRE(normalize_text("5 + 3 - 2 * 4 / 2 = 10") ==
            "پێنج کۆ سێ کەم دوو کەڕەتی چوار دابەش دوو یەکسانە بە دە");
}

TEST_CASE("fractions through the pipeline", "[math][pipeline]") {
    REQUIRE(normalize_text("1/2") == "نیوە");
    REQUIRE(normalize_text("2 1/2") == "دوو و نیو");
    REQUIRE(normalize_text("-5") == "سالب پێنج");
}
