#include <catch2/catch.hpp>
#include <ckbtext/config.hpp>
#include <ckbtext/result.hpp>
#include <memory>
#include <string>

using namespace ckbtext;

static Result<int> parse_threshold(const std::string& s) {
    if (s.empty()) {
        return CkbError{CkbError::InvalidArg, "empty threshold"};
    }
    return Result<int>::ok(std::stoi(s));
}

// Helper function that uses CKBTEXT_TRY
static Result<int> doubled_threshold(const std::string& s) {
    auto r = parse_threshold(s);
    CKBTEXT_TRY(r);
    return Result<int>::ok(r.value() * 2);
}

static Result<EmojiMode> mode_then_shadda(const std::string& emoji,
                                          const std::string& shadda) {
    auto e = parse_emoji_mode(emoji);
    CKBTEXT_TRY(e);
    auto s = parse_shadda_mode(shadda);
    CKBTEXT_TRY(s);
    return Result<EmojiMode>::ok(e.value());
}

static Result<std::unique_ptr<int>> boxed(int v) {
    if (v < 0) return CkbError{CkbError::InvalidArg, "negative"};
    return Result<std::unique_ptr<int>>::ok(std::make_unique<int>(v));
}

// Move-only values pass through CKBTEXT_ASSIGN_OR_RETURN
static Result<int> unboxed_sum(int a, int b) {
    CKBTEXT_ASSIGN_OR_RETURN(std::unique_ptr<int> x, boxed(a));
    CKBTEXT_ASSIGN_OR_RETURN(std::unique_ptr<int> y, boxed(b));
    return Result<int>::ok(*x + *y);
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(CkbError{CkbError::Encoding, "bad utf-8"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == CkbError::Encoding);
    REQUIRE(r.error().message == "bad utf-8");
    REQUIRE(r.has_code(CkbError::Encoding));
    REQUIRE_FALSE(r.has_code(CkbError::IO));
}

TEST_CASE("Wrong-side access throws bad_variant_access", "[result]") {
    auto err = Result<int>::err(CkbError{CkbError::IO, "fail"});
    REQUIRE_THROWS_AS(err.value(), std::bad_variant_access);

    auto ok = Result<int>::ok(1);
    REQUIRE_THROWS_AS(ok.error(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(9) == 3);
    REQUIRE(Result<int>::err(CkbError{CkbError::Parse, "x"}).value_or(9) == 9);
}

TEST_CASE("map and and_then", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return std::to_string(x); });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == "5");

    bool called = false;
    auto bad = Result<int>::err(CkbError{CkbError::Config, "bad"});
    auto chained = bad.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 1);
    });
    REQUIRE(chained.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(chained.error().code == CkbError::Config);
}

TEST_CASE("or_else recovers from Err", "[result]") {
    auto r = Result<int>::err(CkbError{CkbError::IO, "unreadable"});
    auto recovered = r.or_else([](CkbError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("CKBTEXT_TRY propagates and passes through", "[result]") {
    auto bad = doubled_threshold("");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == CkbError::InvalidArg);

    auto good = doubled_threshold("21");
    REQUIRE(good.is_ok());
    REQUIRE(good.value() == 42);
}

TEST_CASE("CKBTEXT_TRY converts across Result types", "[result]") {
    auto ok = mode_then_shadda("convert", "double");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == EmojiMode::Convert);

    auto second_fails = mode_then_shadda("remove", "triple");
    REQUIRE(second_fails.is_err());
    REQUIRE(second_fails.error().message.find("triple") != std::string::npos);
}

TEST_CASE("CKBTEXT_ASSIGN_OR_RETURN with move-only values", "[result]") {
    auto sum = unboxed_sum(2, 3);
    REQUIRE(sum.is_ok());
    REQUIRE(sum.value() == 5);

    auto bad = unboxed_sum(2, -1);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().message == "negative");
}

TEST_CASE("Status ok and err", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(CkbError{CkbError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == CkbError::Config);
}

TEST_CASE("CkbError format() output", "[error]") {
    CkbError e{CkbError::Config, "unknown module toggle 'foo'",
               "check [modules]", "ckbtext.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]") != std::string::npos);
    REQUIRE(formatted.find("unknown module toggle") != std::string::npos);
    REQUIRE(formatted.find("hint: check [modules]") != std::string::npos);
    REQUIRE(formatted.find("--> ckbtext.toml:3") != std::string::npos);
}

TEST_CASE("CkbError format() without hint or file", "[error]") {
    CkbError e{CkbError::Parse, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Parse]") != std::string::npos);
    REQUIRE(formatted.find("hint:") == std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("CkbError in_text points at the input byte", "[error]") {
    std::string input = "سڵاو \xC3 world";
    auto e = CkbError::in_text(CkbError::Encoding, "malformed UTF-8 sequence", input, 9);
    REQUIRE(e.offset == 9);
    REQUIRE(e.has_location());
    REQUIRE(e.excerpt == "سڵاو \\xC3 world");

    auto formatted = e.format();
    REQUIRE(formatted.find("error[Encoding]: malformed UTF-8 sequence") != std::string::npos);
    REQUIRE(formatted.find("--> input byte 9: سڵاو \\xC3 world") != std::string::npos);
}

TEST_CASE("CkbError in_text excerpt is clipped to whole characters", "[error]") {
    std::string input = "یەک دوو سێ چوار پێنج شەش حەوت";
    auto e = CkbError::in_text(CkbError::Encoding, "x", input, input.find("چوار"));
    REQUIRE_FALSE(e.excerpt.empty());
    REQUIRE(e.excerpt.size() < input.size());
    REQUIRE(e.excerpt.find("\\x") == std::string::npos);
    REQUIRE(e.excerpt.find("چوار") != std::string::npos);
}

TEST_CASE("CkbError format() with a line but no file", "[error]") {
    CkbError e{CkbError::Parse, "expected value"};
    e.line = 4;
    REQUIRE(e.format().find("--> line 4") != std::string::npos);
    REQUIRE_FALSE(e.has_location());
}

TEST_CASE("CkbError code_name() for all codes", "[error]") {
    REQUIRE(std::string(CkbError::code_name(CkbError::IO)) == "IO");
    REQUIRE(std::string(CkbError::code_name(CkbError::Parse)) == "Parse");
    REQUIRE(std::string(CkbError::code_name(CkbError::Config)) == "Config");
    REQUIRE(std::string(CkbError::code_name(CkbError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(CkbError::code_name(CkbError::Encoding)) == "Encoding");
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);
}
