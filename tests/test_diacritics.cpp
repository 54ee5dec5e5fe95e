#include <catch2/catch.hpp>
#include <ckbtext/modules/diacritics.hpp>
#include <ckbtext/pipeline.hpp>
#include <ckbtext/tokenizer.hpp>

using namespace ckbtext;

static TokenList run_diacritics(const std::string& input, const Config& cfg = Config()) {
    DiacriticsModule module(cfg);
    auto tokens = tokenize(input);
    module.process(tokens);
    return tokens;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ===== Vowels =====

TEST_CASE("short and long vowels", "[diacritics]") {
    auto toks = run_diacritics("کِتَاب");
    REQUIRE(toks[0].text == "کیتاب");
    REQUIRE(toks[0].is_converted);
}

TEST_CASE("sun letters assimilate the article", "[diacritics]") {
    auto toks = run_diacritics("ٱلشَّمْس");
    REQUIRE(contains(toks[0].text, "ئەششەمس"));
}

TEST_CASE("shadda can be dropped", "[diacritics]") {
    Config cfg;
    cfg.shadda = ShaddaMode::Remove;
    auto toks = run_diacritics("ٱلشَّمْس", cfg);
    REQUIRE(toks[0].text == "ئەشەمس");
}

// ===== Context =====

TEST_CASE("divine name is light after kasra", "[diacritics]") {
    auto toks = run_diacritics("بِسْمِ ٱللَّهِ");
    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].text == "بیسمی");
    REQUIRE(toks[1].text == "للاھی");
}

TEST_CASE("divine name is heavy at utterance start", "[diacritics]") {
    auto toks = run_diacritics("ٱللَّهُ");
    REQUIRE(toks[0].text == "ئەڵڵاھو");

    auto after_stop = run_diacritics("بِسْمِ. ٱللَّهِ");
    REQUIRE(after_stop[2].text == "ئەڵڵاھی");
}

TEST_CASE("ra before an emphatic letter is heavy", "[diacritics]") {
    auto toks = run_diacritics("مِرْصَاد");
    REQUIRE(contains(toks[0].text, "ڕ"));
}

TEST_CASE("nasal assimilation across words", "[diacritics]") {
    auto toks = run_diacritics("مِنْ بَعْدِ");
    REQUIRE(toks[0].text == "میم");
}

// ===== Modes =====

TEST_CASE("remove mode strips marks only", "[diacritics]") {
    Config cfg;
    cfg.diacritics_mode = DiacriticsMode::Remove;
    auto toks = run_diacritics("کِتَاب", cfg);
    REQUIRE(toks[0].text == "کتاب");
    REQUIRE(DiacriticsModule::strip_marks("ٱلشَّمْس") == "الشمس");
}

TEST_CASE("keep mode leaves words alone", "[diacritics]") {
    Config cfg;
    cfg.diacritics_mode = DiacriticsMode::Keep;
    auto toks = run_diacritics("کِتَاب", cfg);
    REQUIRE(toks[0].text == "کِتَاب");
    REQUIRE_FALSE(toks[0].is_converted);
}

TEST_CASE("unvoweled words are not touched", "[diacritics]") {
    auto toks = run_diacritics("کتاب");
    REQUIRE(toks[0].text == "کتاب");
    REQUIRE_FALSE(toks[0].is_converted);
}

TEST_CASE("diacritics through the pipeline", "[diacritics][pipeline]") {
    REQUIRE(normalize_text("بِسْمِ ٱللَّهِ") == "بیسمی للاھی");
}
