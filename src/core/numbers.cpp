#include <ckbtext/numbers.hpp>
#include <ckbtext/text.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace ckbtext {

// ---------------------------------------------------------------------------
// Word tables
// ---------------------------------------------------------------------------

namespace {

const char* const kOnes[] = {
    "", "یەک", "دوو", "سێ", "چوار", "پێنج", "شەش", "حەوت", "ھەشت", "نۆ"
};

const char* const kTeens[] = {
    "دە", "یازدە", "دوازدە", "سێزدە", "چواردە",
    "پازدە", "شازدە", "حەڤدە", "ھەژدە", "نۆزدە"
};

const char* const kTens[] = {
    "", "", "بیست", "سی", "چل", "پەنجا", "شەست", "حەفتا", "ھەشتا", "نەوەد"
};

const char* const kHundred = "سەد";

// Index i names 1000^i
const char* const kScales[] = {
    "", "ھەزار", "ملیۆن", "ملیار", "تریلیۆن",
    "کوادریلیۆن", "کوینتیلیۆن", "سێکستیلیۆن"
};
constexpr size_t kScaleCount = sizeof(kScales) / sizeof(kScales[0]);

const char* const kDigitNames[] = {
    "سفر", "یەک", "دوو", "سێ", "چوار", "پێنج", "شەش", "حەوت", "ھەشت", "نۆ"
};

const char* const kTimes = "کەڕەتی";
const char* const kTenToThe = "دە بە توانی";

std::string below_thousand(int v) {
    std::vector<std::string> parts;
    int h = v / 100;
    int r = v % 100;
    if (h == 1) {
        parts.push_back(kHundred);
    } else if (h > 1) {
        parts.push_back(std::string(kOnes[h]) + " " + kHundred);
    }
    if (r >= 10 && r < 20) {
        parts.push_back(kTeens[r - 10]);
    } else if (r >= 20) {
        parts.push_back(kTens[r / 10]);
        if (r % 10) parts.push_back(kOnes[r % 10]);
    } else if (r > 0) {
        parts.push_back(kOnes[r]);
    }
    return text::join(parts, words::And);
}

std::string strip_leading_zeros(const std::string& digits) {
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return std::string();
    return digits.substr(first);
}

std::string scientific_reading(const std::string& mantissa_int,
                               const std::string& mantissa_frac,
                               bool exp_negative, const std::string& exp_digits) {
    std::string mantissa = integer_to_words(mantissa_int);
    if (!mantissa_frac.empty()) {
        mantissa += " ";
        mantissa += words::Point;
        mantissa += " ";
        mantissa += zero_padded_to_words(mantissa_frac);
    }
    std::string exponent = integer_to_words(exp_digits);
    if (exp_negative && strip_leading_zeros(exp_digits) != "") {
        exponent = std::string(words::Minus) + " " + exponent;
    }
    return mantissa + " " + kTimes + " " + kTenToThe + " " + exponent;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Cardinals
// ---------------------------------------------------------------------------

std::string integer_to_words(const std::string& digits) {
    std::string d = strip_leading_zeros(digits);
    if (d.empty()) return words::Zero;

    size_t group_count = (d.size() + 2) / 3;
    if (group_count > kScaleCount) return digits_to_words(d);

    std::vector<std::string> parts;
    size_t first_len = d.size() - (group_count - 1) * 3;
    size_t at = 0;
    for (size_t g = 0; g < group_count; ++g) {
        size_t len = (g == 0) ? first_len : 3;
        int v = std::atoi(d.substr(at, len).c_str());
        at += len;
        size_t scale = group_count - 1 - g;
        if (v == 0) continue;
        if (scale == 0) {
            parts.push_back(below_thousand(v));
        } else if (scale == 1 && v == 1) {
            parts.push_back(kScales[1]);
        } else {
            parts.push_back(below_thousand(v) + " " + kScales[scale]);
        }
    }
    return text::join(parts, words::And);
}

std::string int_to_words(long long n) {
    if (n < 0) {
        return std::string(words::Minus) + " " + integer_to_words(std::to_string(-n));
    }
    return integer_to_words(std::to_string(n));
}

std::string digits_to_words(const std::string& digits) {
    std::vector<std::string> parts;
    for (UChar32 c : text::decode(digits)) {
        int v = text::digit_value(c);
        if (v >= 0) parts.push_back(kDigitNames[v]);
    }
    return text::join(parts, " ");
}

std::string zero_padded_to_words(const std::string& digits) {
    std::string ascii = text::ascii_digits(digits);
    size_t first = ascii.find_first_not_of('0');
    if (first == std::string::npos) return digits_to_words(ascii);

    std::vector<std::string> parts;
    for (size_t k = 0; k < first; ++k) parts.push_back(words::Zero);
    parts.push_back(integer_to_words(ascii.substr(first)));
    return text::join(parts, " ");
}

// ---------------------------------------------------------------------------
// Literals
// ---------------------------------------------------------------------------

std::optional<NumberParts> split_number(const std::string& literal) {
    std::string s = text::ascii_digits(literal);
    NumberParts parts;
    size_t i = 0;

    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        parts.negative = (s[i] == '-');
        ++i;
    }
    while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == ',')) {
        if (s[i] != ',') parts.integer += s[i];
        ++i;
    }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            parts.fraction += s[i++];
        }
        if (parts.fraction.empty()) return std::nullopt;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        parts.has_exponent = true;
        ++i;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
            parts.exponent_negative = (s[i] == '-');
            ++i;
        }
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            parts.exponent += s[i++];
        }
        if (parts.exponent.empty()) return std::nullopt;
    }
    if (i != s.size()) return std::nullopt;
    if (parts.integer.empty() && parts.fraction.empty()) return std::nullopt;
    return parts;
}

std::optional<std::string> number_to_words(const std::string& literal,
                                           const NumberReadingOptions& opts) {
    auto split = split_number(literal);
    if (!split) return std::nullopt;
    const NumberParts& p = *split;

    std::string reading;

    if (p.has_exponent) {
        std::string mi = p.integer.empty() ? "0" : p.integer;
        reading = scientific_reading(mi, p.fraction, p.exponent_negative, p.exponent);
    } else {
        std::string plain = p.integer.empty() ? "0" : p.integer;
        if (!p.fraction.empty()) plain += "." + p.fraction;
        double value = std::strtod(plain.c_str(), nullptr);
        double mag = std::fabs(value);

        if (value != 0.0 && (mag < opts.scientific_low || mag >= opts.scientific_high)) {
            // Normalize to d.ddd x 10^e from the digit string itself
            std::string all = p.integer + p.fraction;
            size_t lead = all.find_first_not_of('0');
            long exp = static_cast<long>(p.integer.size()) - 1 - static_cast<long>(lead);
            std::string sig = all.substr(lead);
            size_t last = sig.find_last_not_of('0');
            sig = sig.substr(0, last + 1);
            reading = scientific_reading(sig.substr(0, 1), sig.substr(1),
                                         exp < 0, std::to_string(exp < 0 ? -exp : exp));
        } else {
            std::string int_words;
            if (p.integer.size() > 1 && p.integer[0] == '0') {
                int_words = digits_to_words(p.integer);
            } else {
                int_words = integer_to_words(p.integer);
            }

            if (p.fraction.empty()) {
                reading = int_words;
            } else if (p.fraction == "5" && p.integer.size() == 1 && p.integer != "0") {
                reading = int_words + words::And + words::Half;
            } else {
                reading = int_words + " " + words::Point + " " +
                          zero_padded_to_words(p.fraction);
            }
        }
    }

    if (p.negative) reading = std::string(words::Minus) + " " + reading;
    return reading;
}

std::optional<std::string> dotted_sequence_to_words(const std::string& literal) {
    std::string ascii = text::ascii_digits(literal);
    std::vector<std::string> groups;
    size_t start = 0;
    while (true) {
        size_t dot = ascii.find('.', start);
        std::string group = ascii.substr(start, dot == std::string::npos ? std::string::npos
                                                                         : dot - start);
        if (group.empty() || !text::is_all_digits(group)) return std::nullopt;
        groups.push_back(zero_padded_to_words(group));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    if (groups.size() < 3) return std::nullopt;
    return text::join(groups, std::string(" ") + words::Dot + " ");
}

std::optional<long long> parse_int(const std::string& s) {
    std::string ascii = text::ascii_digits(text::trim(s));
    if (ascii.empty() || ascii.size() > 18) return std::nullopt;
    long long v = 0;
    for (char c : ascii) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        v = v * 10 + (c - '0');
    }
    return v;
}

} // namespace ckbtext
