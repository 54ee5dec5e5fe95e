#include <catch2/catch.hpp>
#include <ckbtext/modules/grammar.hpp>
#include <ckbtext/modules/linguistics.hpp>
#include <ckbtext/pipeline.hpp>
#include <ckbtext/suffixes.hpp>
#include <ckbtext/tokenizer.hpp>

using namespace ckbtext;

static TokenList run_linguistics(const std::string& input) {
    LinguisticsModule module{Config()};
    auto tokens = tokenize(input);
    module.process(tokens);
    compact(tokens);
    return tokens;
}

// ===== Linguistics =====

TEST_CASE("abbreviations are expanded", "[linguistics]") {
    REQUIRE(run_linguistics("هتد")[0].text == "ھەتا دوایی");

    auto doctor = run_linguistics("د. ئەحمەد");
    REQUIRE(doctor.size() == 2);
    REQUIRE(doctor[0].text == "دکتۆر");
}

TEST_CASE("Arabic names get Kurdish spelling", "[linguistics]") {
    REQUIRE(run_linguistics("علي")[0].text == "عەلی");
}

TEST_CASE("Arabic letter forms are canonicalized", "[linguistics]") {
    REQUIRE(run_linguistics("كتاب")[0].text == "کتاب");
    REQUIRE(run_linguistics("تـە")[0].text == "تە");
    REQUIRE(LinguisticsModule::canonicalize("مدرسة") == "مدرسە");
    REQUIRE(LinguisticsModule::canonicalize("هاوڕێ") == "ھاوڕێ");
    REQUIRE(LinguisticsModule::canonicalize("خانه") == "خانە");

    auto toks = run_linguistics("كتاب");
    REQUIRE_FALSE(toks[0].is_converted);
}

// ===== Grammar =====

TEST_CASE("suffix table", "[grammar]") {
    REQUIRE(is_grammar_suffix("ەکان"));
    REQUIRE(is_grammar_suffix("یش"));
    REQUIRE_FALSE(is_grammar_suffix("سڵاو"));
    const auto& table = grammar_suffixes();
    for (size_t k = 1; k < table.size(); ++k) {
        REQUIRE(table[k - 1].size() >= table[k].size());
    }
}

TEST_CASE("append_suffix inserts a linking ی after vowels", "[grammar]") {
    REQUIRE(append_suffix("دە", "ەکە") == "دەیەکە");
    REQUIRE(append_suffix("سەد", "ەکە") == "سەدەکە");
    REQUIRE(append_suffix("نیوەڕۆ", "ە") == "نیوەڕۆیە");
    REQUIRE(append_suffix("پێنج", "م") == "پێنجم");
}

TEST_CASE("grammar pass attaches suffixes to converted hosts", "[grammar]") {
    TokenList toks{Token("10", TokenType::Number), Token("ەکان", TokenType::Word)};
    toks[0].rewrite("دە");
    GrammarModule{Config()}.process(toks);
    compact(toks);
    REQUIRE(toks.size() == 1);
    REQUIRE(toks[0].text == "دەیەکان");
}

TEST_CASE("grammar pass ignores spaced words", "[grammar]") {
    TokenList toks{Token("10", TokenType::Number, " "), Token("ەکان", TokenType::Word)};
    toks[0].rewrite("دە");
    GrammarModule{Config()}.process(toks);
    REQUIRE_FALSE(toks[1].is_dead());
}

TEST_CASE("suffixes through the pipeline", "[grammar][pipeline]") {
    REQUIRE(normalize_text("10ەکە") == "دەیەکە");
    REQUIRE(normalize_text("5ـم") == "پێنجم");
}
