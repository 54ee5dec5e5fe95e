#include <ckbtext/modules/phone.hpp>
#include <ckbtext/log.hpp>
#include <ckbtext/numbers.hpp>
#include <ckbtext/text.hpp>
#include <algorithm>
#include <unordered_set>

namespace ckbtext {

namespace {

const char* const kPlus = "کۆ";

bool is_country_code(const std::string& code) {
    static const std::unordered_set<std::string> codes = {
        "1", "7", "20", "27", "30", "31", "32", "33", "34", "36", "39",
        "40", "41", "43", "44", "45", "46", "47", "48", "49", "51", "52",
        "54", "55", "60", "61", "62", "63", "64", "65", "66", "81", "82",
        "84", "86", "90", "91", "92", "93", "94", "95", "98",
        "212", "213", "216", "218", "249", "351", "353", "358", "380",
        "961", "962", "963", "964", "965", "966", "967", "968", "970",
        "971", "972", "973", "974", "994", "995",
    };
    return codes.count(code) > 0;
}

// Threes from the left, the last four digits as 2-2
void group_subscriber(const std::string& digits, std::vector<std::string>& out) {
    size_t n = digits.size();
    if (n <= 3) {
        if (n) out.push_back(digits);
        return;
    }
    size_t lead = n - 4;
    for (size_t at = 0; at < lead; at += 3) {
        out.push_back(digits.substr(at, std::min<size_t>(3, lead - at)));
    }
    out.push_back(digits.substr(lead, 2));
    out.push_back(digits.substr(lead + 2, 2));
}

bool is_spaced_local(const TokenList& tokens, size_t i) {
    static const size_t widths[] = {4, 3, 2, 2};
    if (i + 4 > tokens.size()) return false;
    for (size_t k = 0; k < 4; ++k) {
        const Token& t = tokens[i + k];
        if (t.type != TokenType::Number || t.is_converted) return false;
        if (!text::is_all_digits(t.text) || text::length(t.text) != widths[k]) return false;
        if (k < 3 && t.whitespace_after != " ") return false;
    }
    return text::ascii_digits(tokens[i].text)[0] == '0';
}

} // anonymous namespace

std::vector<std::string> PhoneModule::group_digits(const std::string& number) {
    std::vector<std::string> groups;
    std::string ascii = text::ascii_digits(number);

    if (!ascii.empty() && ascii[0] == '+') {
        std::string digits = ascii.substr(1);
        size_t cc_len = 3;
        for (size_t len = 1; len <= 3; ++len) {
            if (is_country_code(digits.substr(0, len))) {
                cc_len = len;
                break;
            }
        }
        cc_len = std::min(cc_len, digits.size());
        groups.push_back("+" + digits.substr(0, cc_len));
        group_subscriber(digits.substr(cc_len), groups);
        return groups;
    }

    if (ascii.size() == 11) {
        groups.push_back(ascii.substr(0, 4));
        groups.push_back(ascii.substr(4, 3));
        groups.push_back(ascii.substr(7, 2));
        groups.push_back(ascii.substr(9, 2));
        return groups;
    }

    group_subscriber(ascii, groups);
    return groups;
}

std::string PhoneModule::speak(const std::string& number) const {
    std::vector<std::string> parts;
    for (const auto& g : group_digits(number)) {
        if (g[0] == '+') {
            parts.push_back(std::string(kPlus) + " " + integer_to_words(g.substr(1)));
        } else {
            parts.push_back(zero_padded_to_words(g));
        }
    }
    return text::join(parts, config().pause_markers ? " | " : " ");
}

void PhoneModule::process(TokenList& tokens) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || t.is_converted) continue;

        if (t.type == TokenType::Phone) {
            t.rewrite(speak(t.text), TokenType::Phone);
            t.add_tag(tags::Phone);
            continue;
        }

        if (is_spaced_local(tokens, i)) {
            std::string joined;
            for (size_t k = 0; k < 4; ++k) joined += tokens[i + k].text;
            logger().debug("joining spaced phone number %s", joined.c_str());
            t.whitespace_after = tokens[i + 3].whitespace_after;
            t.rewrite(speak(joined), TokenType::Phone);
            t.add_tag(tags::Phone);
            for (size_t k = 1; k < 4; ++k) tokens[i + k].erase();
            i += 3;
        }
    }
}

} // namespace ckbtext
