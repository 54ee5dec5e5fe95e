#include <catch2/catch.hpp>
#include <ckbtext/modules/emoji.hpp>
#include <ckbtext/modules/symbol.hpp>
#include <ckbtext/pipeline.hpp>
#include <ckbtext/tokenizer.hpp>

using namespace ckbtext;

template<typename M>
static std::string run_module(const std::string& input, const Config& cfg = Config()) {
    M module(cfg);
    auto tokens = tokenize(input);
    module.process(tokens);
    compact(tokens);
    return canonicalize_whitespace(detokenize(tokens));
}

// ===== Symbols =====

TEST_CASE("repeated sentence punctuation collapses", "[symbols]") {
    REQUIRE(run_module<SymbolModule>("باشە!!!") == "باشە!");
    REQUIRE(run_module<SymbolModule>("چی؟؟") == "چی؟");
    REQUIRE(run_module<SymbolModule>("a. b.") == "a. b.");
}

TEST_CASE("ampersand and degree signs", "[symbols]") {
    REQUIRE(run_module<SymbolModule>("ئەمە & ئەوە") == "ئەمە و ئەوە");
    REQUIRE(run_module<SymbolModule>("° ") == "پلە");
}

TEST_CASE("decorations are removed", "[symbols]") {
    REQUIRE(run_module<SymbolModule>("«سڵاو»") == "سڵاو");
    REQUIRE(run_module<SymbolModule>("(تێبینی)") == "تێبینی");
    REQUIRE(run_module<SymbolModule>("یەک | دوو") == "یەک دوو");
}

TEST_CASE("pause markers keep the bar", "[symbols]") {
    Config cfg;
    cfg.pause_markers = true;
    REQUIRE(run_module<SymbolModule>("یەک | دوو", cfg) == "یەک | دوو");
}

TEST_CASE("symbols through the pipeline", "[symbols][pipeline]") {
    REQUIRE(normalize_text("50%") == "پەنجا لە سەدا");
    REQUIRE(normalize_text("25°C") == "بیست و پێنج پلەی سەدی");
}

// ===== Emoji =====

TEST_CASE("emoji are removed by default", "[emoji]") {
    REQUIRE(run_module<EmojiModule>("سڵاو 😀") == "سڵاو");
    REQUIRE(run_module<EmojiModule>("👍🏽 باشە") == "باشە");
}

TEST_CASE("emoji are named in convert mode", "[emoji]") {
    Config cfg;
    cfg.emoji = EmojiMode::Convert;
    REQUIRE(run_module<EmojiModule>("😀", cfg) == "دەموچاوی پێکەنین");
    REQUIRE(run_module<EmojiModule>("👍🏽", cfg) == "پەنجەی گەورە بۆ سەرەوە");
    REQUIRE(run_module<EmojiModule>("باشە 🦄", cfg) == "باشە");
}

TEST_CASE("emoji are kept in ignore mode", "[emoji]") {
    Config cfg;
    cfg.emoji = EmojiMode::Ignore;
    REQUIRE(run_module<EmojiModule>("سڵاو 😀", cfg) == "سڵاو 😀");
}
