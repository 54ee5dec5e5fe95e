#include <catch2/catch.hpp>
#include <ckbtext/modules/phone.hpp>
#include <ckbtext/pipeline.hpp>
#include <ckbtext/tokenizer.hpp>

using namespace ckbtext;

static TokenList run_phone(const std::string& input, const Config& cfg = Config()) {
    PhoneModule module(cfg);
    auto tokens = tokenize(input);
    module.process(tokens);
    compact(tokens);
    return tokens;
}

// ===== Grouping =====

TEST_CASE("group international numbers by country code", "[phone]") {
    auto g = PhoneModule::group_digits("+9647501234567");
    REQUIRE(g == std::vector<std::string>{"+964", "750", "123", "45", "67"});

    auto us = PhoneModule::group_digits("+12025550123");
    REQUIRE(us.front() == "+1");
    REQUIRE(us.back() == "23");
}

TEST_CASE("unknown country codes take three digits", "[phone]") {
    auto g = PhoneModule::group_digits("+8881234567890");
    REQUIRE(g.front() == "+888");
}

TEST_CASE("group local eleven-digit numbers 4-3-2-2", "[phone]") {
    auto g = PhoneModule::group_digits("07501234567");
    REQUIRE(g == std::vector<std::string>{"0750", "123", "45", "67"});

    auto eastern = PhoneModule::group_digits("٠٧٥٠١٢٣٤٥٦٧");
    REQUIRE(eastern == g);
}

// ===== Speaking =====

TEST_CASE("speak international number", "[phone]") {
    auto toks = run_phone("+9647501234567");
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].type == TokenType::Phone);
    REQUIRE(toks[0].has_tag(tags::Phone));
    REQUIRE(toks[0].is_converted);
    REQUIRE(toks[0].text ==
            "کۆ نۆ سەد و شەست و چوار حەوت سەد و پەنجا سەد و بیست و سێ چل و پێنج شەست و حەوت");
}

TEST_CASE("leading zero is read as سفر", "[phone]") {
    auto toks = run_phone("07501234567");
    REQUIRE(toks[0].text ==
            "سفر حەوت سەد و پەنجا سەد و بیست و سێ چل و پێنج شەست و حەوت");
}

TEST_CASE("pause markers separate groups", "[phone]") {
    Config cfg;
    cfg.pause_markers = true;
    auto toks = run_phone("07501234567", cfg);
    REQUIRE(toks[0].text ==
            "سفر حەوت سەد و پەنجا | سەد و بیست و سێ | چل و پێنج | شەست و حەوت");
}

TEST_CASE("spaced local number is merged", "[phone]") {
    auto toks = run_phone("0750 123 45 67 ژمارەکەمە");
    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].type == TokenType::Phone);
    REQUIRE(toks[0].original_text == "0750");
    REQUIRE(toks[0].whitespace_after == " ");
    REQUIRE(toks[0].text.find("شەست و حەوت") != std::string::npos);
}

TEST_CASE("ordinary number runs are not merged", "[phone]") {
    auto toks = run_phone("1750 123 45 67");
    REQUIRE(toks.size() == 4);
    REQUIRE_FALSE(toks[0].is_converted);
}
