#include <ckbtext/modules/date_time.hpp>
#include <ckbtext/log.hpp>
#include <ckbtext/numbers.hpp>
#include <ckbtext/suffixes.hpp>
#include <ckbtext/text.hpp>
#include <vector>

namespace ckbtext {

namespace {

const char* const kMonths[12] = {
    "کانونی دووەم", "شوبات", "ئازار", "نیسان", "ئایار", "حوزەیران",
    "تەمموز", "ئاب", "ئەیلوول", "تشرینی یەکەم", "تشرینی دووەم", "کانونی یەکەم"
};

struct Marker {
    const char* text;
    DayHalf half;
};

// Tried in order; the first whose remainder is empty or a suffix wins
const Marker kMarkers[] = {
    {"AM", DayHalf::Am},
    {"A.M.", DayHalf::Am},
    {"A.M", DayHalf::Am},
    {"پ.ن", DayHalf::Am},
    {"بەیانی", DayHalf::Am},
    {"پێش نیوەڕۆ", DayHalf::Am},
    {"پێشنیوەڕۆ", DayHalf::Am},
    {"PM", DayHalf::Pm},
    {"P.M.", DayHalf::Pm},
    {"P.M", DayHalf::Pm},
    {"د.ن", DayHalf::Pm},
    {"دوای نیوەڕۆ", DayHalf::Pm},
    {"دوای نیوەرۆ", DayHalf::Pm},
    {"دوا نیوەڕۆ", DayHalf::Pm},
    {"پاش نیوەڕۆ", DayHalf::Pm},
    {"پاش نیوەرۆ", DayHalf::Pm},
    {"پاشنیوەڕۆ", DayHalf::Pm},
    {"ئێوارە", DayHalf::Pm},
    {"عەسر", DayHalf::Pm},
    {"نیوەڕۆ", DayHalf::Pm},
    {"شەو", DayHalf::Night},
};

constexpr size_t kMaxWindow = 3;

// Concatenated window text with spaces, joiners and a leading linking ی removed
std::string compact_window(const TokenList& tokens, size_t from, size_t count) {
    std::string joined;
    for (size_t k = from; k < from + count; ++k) joined += tokens[k].text;
    joined = text::strip_joiners(text::remove_spaces(joined));

    std::string first = text::first_char(joined);
    if ((first == "ی" || first == "ي") && joined.size() > first.size()) {
        joined = joined.substr(first.size());
    }
    return joined;
}

bool window_usable(const TokenList& tokens, size_t from, size_t count) {
    if (from + count > tokens.size()) return false;
    for (size_t k = from; k < from + count; ++k) {
        const Token& t = tokens[k];
        if (t.is_dead() || t.is_converted || t.type == TokenType::Unknown) return false;
    }
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Dates
// ---------------------------------------------------------------------------

std::optional<DateParts> DateTimeModule::parse_date(const std::string& literal) {
    std::string ascii = text::ascii_digits(literal);
    std::vector<std::string> fields;
    std::string cur;
    for (char c : ascii) {
        if (c == '/' || c == '-' || c == '.') {
            fields.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    fields.push_back(cur);
    if (fields.size() != 3) return std::nullopt;

    std::optional<long long> v[3];
    for (int k = 0; k < 3; ++k) {
        v[k] = parse_int(fields[k]);
        if (!v[k]) return std::nullopt;
    }

    DateParts d;
    if (fields[0].size() == 4 && *v[1] >= 1 && *v[1] <= 12) {
        d.year = *v[0];
        d.month = *v[1];
        d.day = *v[2];
    } else if (fields[2].size() == 4) {
        d.year = *v[2];
        if (*v[1] > 12 && *v[0] <= 12) {
            d.month = *v[0];
            d.day = *v[1];
        } else {
            d.day = *v[0];
            d.month = *v[1];
        }
    } else {
        return std::nullopt;
    }
    return d;
}

std::string DateTimeModule::speak_date(const DateParts& d) {
    std::string month;
    if (d.month >= 1 && d.month <= 12) {
        month = kMonths[d.month - 1];
    } else {
        month = "مانگی " + int_to_words(d.month);
    }
    return int_to_words(d.day) + "ی " + month + "ی ساڵی " + int_to_words(d.year);
}

// ---------------------------------------------------------------------------
// Times
// ---------------------------------------------------------------------------

const char* DateTimeModule::day_period(long long h) {
    if (h >= 0 && h < 1)   return "نیوەشەو";
    if (h >= 1 && h < 4)   return "شەو";
    if (h >= 4 && h < 6)   return "بەرەبەیان";
    if (h >= 6 && h < 10)  return "بەیانی";
    if (h >= 10 && h < 12) return "پێش نیوەڕۆ";
    if (h >= 12 && h < 14) return "نیوەڕۆ";
    if (h >= 14 && h < 18) return "دوای نیوەڕۆ";
    if (h >= 18 && h < 21) return "ئێوارە";
    return "شەو";
}

std::string DateTimeModule::speak_time(long long hour, long long minute, DayHalf half) {
    hour += minute / 60;
    minute %= 60;

    bool am = half == DayHalf::Am;
    bool pm = half == DayHalf::Pm;
    if (half == DayHalf::Night) {
        am = hour == 12 || (hour >= 1 && hour <= 4);
        pm = !am;
    }

    long long hour24 = hour;
    if (pm && hour >= 1 && hour < 12) {
        hour24 = hour + 12;
    } else if (am && hour == 12) {
        hour24 = 0;
    }
    hour24 %= 24;

    long long hour12 = hour24 % 12 ? hour24 % 12 : 12;
    std::string h = int_to_words(hour12);
    std::string m = int_to_words(minute);

    bool with_period = half != DayHalf::None || hour > 12 || hour == 0;
    if (with_period) {
        std::string label = day_period(hour24);
        if (minute == 0)  return h + "ی " + label;
        if (minute == 30) return h + " و نیوی " + label;
        return h + " و " + m + " خولەکی " + label;
    }
    if (minute == 0)  return h;
    if (minute == 30) return h + " و نیو";
    return h + " و " + m + " خولەک";
}

DayHalf DateTimeModule::match_marker(const std::string& compact, std::string& remainder) {
    std::string upper = text::to_upper(compact);
    for (const auto& m : kMarkers) {
        std::string marker = text::remove_spaces(m.text);
        if (!text::starts_with(upper, marker)) continue;
        std::string rest = upper.substr(marker.size());
        if (!rest.empty() && !is_grammar_suffix(rest)) continue;
        remainder = rest;
        return m.half;
    }
    remainder.clear();
    return DayHalf::None;
}

// ---------------------------------------------------------------------------
// Pass
// ---------------------------------------------------------------------------

void DateTimeModule::process(TokenList& tokens) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || t.is_converted) continue;

        if (t.type == TokenType::Date) {
            auto date = parse_date(t.text);
            if (!date) {
                logger().debug("unresolved date field order: %s", t.text.c_str());
                continue;
            }
            t.rewrite(speak_date(*date));
            t.add_tag(tags::Date);
            continue;
        }

        if (t.type != TokenType::Time) continue;

        // Split "10:30pm" into clock digits and inline marker
        std::string clock;
        std::string inline_marker;
        for (char c : text::ascii_digits(t.text)) {
            if ((c >= '0' && c <= '9') || c == ':') clock += c;
            else if (c != ' ') inline_marker += c;
        }
        size_t colon = clock.find(':');
        if (colon == std::string::npos) continue;
        auto hour = parse_int(clock.substr(0, colon));
        auto minute = parse_int(clock.substr(colon + 1, 2));
        if (!hour || !minute) continue;

        DayHalf half = DayHalf::None;
        std::string suffix;
        for (size_t width = kMaxWindow; width >= 1; --width) {
            if (!window_usable(tokens, i + 1, width)) continue;
            std::string rest;
            DayHalf found = match_marker(compact_window(tokens, i + 1, width), rest);
            if (found == DayHalf::None) continue;

            half = found;
            suffix = rest;
            for (size_t k = i + 1; k <= i + width; ++k) {
                t.whitespace_after += tokens[k].whitespace_after;
                tokens[k].erase();
            }
            break;
        }

        if (half == DayHalf::None && !inline_marker.empty()) {
            std::string rest;
            half = match_marker(inline_marker, rest);
        }

        std::string spoken = speak_time(*hour, *minute, half);
        t.rewrite(append_suffix(spoken, suffix));
        t.add_tag(tags::Time);
    }
}

} // namespace ckbtext
