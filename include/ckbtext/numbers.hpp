#pragma once

#include <optional>
#include <string>

namespace ckbtext {

namespace words {
inline constexpr const char* Zero  = "سفر";
inline constexpr const char* Point = "پۆینت";
inline constexpr const char* Dot   = "دۆت";
inline constexpr const char* And   = " و ";
inline constexpr const char* Half  = "نیو";
inline constexpr const char* Minus = "سالب";
inline constexpr const char* Plus  = "موجەب";
} // namespace words

// Sorani cardinal for an ASCII digit string ("123" -> "سەد و بیست و سێ").
// Leading zeros are ignored; magnitudes past the scale table fall back to
// digit-by-digit reading.
std::string integer_to_words(const std::string& digits);

std::string int_to_words(long long n);

// Each digit read on its own ("0025" -> "سفر سفر دوو پێنج")
std::string digits_to_words(const std::string& digits);

// Leading zeros read as "سفر" each, the remainder as one cardinal
// ("0750" -> "سفر حەوت سەد و پەنجا")
std::string zero_padded_to_words(const std::string& digits);

// Components of a numeric literal after digit canonicalization
struct NumberParts {
    bool negative = false;
    std::string integer;     // ASCII digits, may be empty for ".5"
    std::string fraction;    // ASCII digits after the decimal point
    bool has_exponent = false;
    bool exponent_negative = false;
    std::string exponent;    // ASCII digits
};

// Split "-1,234.50e+3" style literals (any supported digit set). nullopt if
// anything else is present.
std::optional<NumberParts> split_number(const std::string& literal);

struct NumberReadingOptions {
    double scientific_low = 1e-20;
    double scientific_high = 1e21;
};

// Full spoken reading of a numeric literal: sign, integer, fraction, the
// "و نیو" half idiom, leading-zero digit reading and scientific phrasing.
// nullopt when the literal cannot be parsed.
std::optional<std::string> number_to_words(const std::string& literal,
                                           const NumberReadingOptions& opts = {});

// Version numbers and addresses ("1.2.3.4", "192.168.0.1"): three or more
// digit groups joined by '.', each group read on its own with "دۆت" between
// them. nullopt for anything else, including plain decimals.
std::optional<std::string> dotted_sequence_to_words(const std::string& literal);

// Parse a small non-negative integer from any supported digit set
std::optional<long long> parse_int(const std::string& s);

} // namespace ckbtext
