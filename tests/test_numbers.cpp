#include <catch2/catch.hpp>
#include <ckbtext/numbers.hpp>

using namespace ckbtext;

// ===== Cardinals =====

TEST_CASE("integer_to_words small numbers", "[numbers]") {
    REQUIRE(integer_to_words("0") == "سفر");
    REQUIRE(integer_to_words("7") == "حەوت");
    REQUIRE(integer_to_words("12") == "دوازدە");
    REQUIRE(integer_to_words("21") == "بیست و یەک");
    REQUIRE(integer_to_words("100") == "سەد");
    REQUIRE(integer_to_words("123") == "سەد و بیست و سێ");
    REQUIRE(integer_to_words("305") == "سێ سەد و پێنج");
}

TEST_CASE("integer_to_words scales", "[numbers]") {
    REQUIRE(integer_to_words("1000") == "ھەزار");
    REQUIRE(integer_to_words("2500") == "دوو ھەزار و پێنج سەد");
    REQUIRE(integer_to_words("1000000") == "یەک ملیۆن");
    REQUIRE(integer_to_words("2000001") == "دوو ملیۆن و یەک");
    REQUIRE(integer_to_words("007") == "حەوت");
}

TEST_CASE("integer_to_words past the scale table reads digits", "[numbers]") {
    std::string huge(30, '1');
    std::string reading = integer_to_words(huge);
    REQUIRE(reading.find("ملیۆن") == std::string::npos);
    REQUIRE(reading.find("یەک یەک") != std::string::npos);
}

TEST_CASE("int_to_words handles negatives", "[numbers]") {
    REQUIRE(int_to_words(-15) == "سالب پازدە");
    REQUIRE(int_to_words(0) == "سفر");
}

TEST_CASE("digit and zero-padded readings", "[numbers]") {
    REQUIRE(digits_to_words("0025") == "سفر سفر دوو پێنج");
    REQUIRE(zero_padded_to_words("0750") == "سفر حەوت سەد و پەنجا");
    REQUIRE(zero_padded_to_words("00") == "سفر سفر");
    REQUIRE(zero_padded_to_words("٠٥") == "سفر پێنج");
}

// ===== Literals =====

TEST_CASE("split_number", "[numbers]") {
    auto p = split_number("-1,234.50e+3");
    REQUIRE(p.has_value());
    REQUIRE(p->negative);
    REQUIRE(p->integer == "1234");
    REQUIRE(p->fraction == "50");
    REQUIRE(p->has_exponent);
    REQUIRE_FALSE(p->exponent_negative);
    REQUIRE(p->exponent == "3");

    REQUIRE_FALSE(split_number("12a").has_value());
    REQUIRE_FALSE(split_number("").has_value());
    REQUIRE_FALSE(split_number("5.").has_value());
    REQUIRE_FALSE(split_number("2e").has_value());
}

TEST_CASE("number_to_words decimals and the half idiom", "[numbers]") {
    REQUIRE(number_to_words("2.5").value() == "دوو و نیو");
    REQUIRE(number_to_words("0.5").value() == "سفر پۆینت پێنج");
    REQUIRE(number_to_words("12.5").value() == "دوازدە پۆینت پێنج");
    REQUIRE(number_to_words("3.14").value() == "سێ پۆینت چواردە");
    REQUIRE(number_to_words("0.05").value() == "سفر پۆینت سفر پێنج");
}

TEST_CASE("number_to_words signs, groups and digit sets", "[numbers]") {
    REQUIRE(number_to_words("-7").value() == "سالب حەوت");
    REQUIRE(number_to_words("1,234").value() == "ھەزار و دوو سەد و سی و چوار");
    REQUIRE(number_to_words("١٢").value() == "دوازدە");
    REQUIRE(number_to_words("۲۰").value() == "بیست");
    REQUIRE(number_to_words("007").value() == "سفر سفر حەوت");
    REQUIRE_FALSE(number_to_words("abc").has_value());
}

TEST_CASE("number_to_words scientific forms", "[numbers]") {
    REQUIRE(number_to_words("5e-10").value() == "پێنج کەڕەتی دە بە توانی سالب دە");
    REQUIRE(number_to_words("2.5E3").value() == "دوو پۆینت پێنج کەڕەتی دە بە توانی سێ");

    std::string big = "1" + std::string(21, '0');
    REQUIRE(number_to_words(big).value() == "یەک کەڕەتی دە بە توانی بیست و یەک");

    NumberReadingOptions narrow;
    narrow.scientific_high = 1000.0;
    REQUIRE(number_to_words("25000", narrow).value() ==
            "دوو پۆینت پێنج کەڕەتی دە بە توانی چوار");
    REQUIRE(number_to_words("999", narrow).value() == "نۆ سەد و نەوەد و نۆ");
}

TEST_CASE("dotted sequences read group by group", "[numbers]") {
    REQUIRE(dotted_sequence_to_words("1.2.3.4") == std::string("یەک دۆت دوو دۆت سێ دۆت چوار"));
    REQUIRE(dotted_sequence_to_words("10.0.1") == std::string("دە دۆت سفر دۆت یەک"));
    REQUIRE(dotted_sequence_to_words("1.05.3") == std::string("یەک دۆت سفر پێنج دۆت سێ"));
    REQUIRE(dotted_sequence_to_words("١.٢.٣") == std::string("یەک دۆت دوو دۆت سێ"));

    REQUIRE_FALSE(dotted_sequence_to_words("2.5").has_value());
    REQUIRE_FALSE(dotted_sequence_to_words("1..2.3").has_value());
    REQUIRE_FALSE(dotted_sequence_to_words("1.2.3.").has_value());
    REQUIRE_FALSE(dotted_sequence_to_words("1.a.3").has_value());
}

TEST_CASE("parse_int", "[numbers]") {
    REQUIRE(parse_int("42").value() == 42);
    REQUIRE(parse_int("٠٩").value() == 9);
    REQUIRE_FALSE(parse_int("4a").has_value());
    REQUIRE_FALSE(parse_int("").has_value());
}
