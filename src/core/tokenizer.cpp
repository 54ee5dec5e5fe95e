#include <ckbtext/tokenizer.hpp>
#include <ckbtext/text.hpp>
#include <cctype>

namespace ckbtext {

namespace {

bool is_superscript_digit(UChar32 c) {
    return c == 0x2070 || c == 0x00B9 || c == 0x00B2 || c == 0x00B3 ||
           (c >= 0x2074 && c <= 0x2079);
}

bool is_subscript_digit(UChar32 c) {
    return c >= 0x2080 && c <= 0x2089;
}

bool is_date_separator(UChar32 c) {
    return c == '/' || c == '-' || c == '.';
}

// Sentence punctuation that may trail a URL without belonging to it
bool is_url_trailer(UChar32 c) {
    return c == '.' || c == ',' || c == ';' || c == ':' || c == '!' ||
           c == '?' || c == ')' || c == ']' || c == '"' || c == '\'' ||
           c == 0x060C || c == 0x061B || c == 0x061F || c == 0x00BB;
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

struct Lexer {
    const std::string& source;
    size_t pos;

    TokenList tokens;

    explicit Lexer(const std::string& src) : source(src), pos(0) {}

    bool at_end() const { return pos >= source.size(); }

    // Code point at byte offset `at`; `next` receives the following offset
    UChar32 cp_at(size_t at, size_t& next) const {
        next = at;
        if (at >= source.size()) return -1;
        return text::next_code_point(source, next);
    }

    UChar32 cp_at(size_t at) const {
        size_t next;
        return cp_at(at, next);
    }

    bool ascii_at_ci(size_t at, const char* word) const {
        for (size_t k = 0; word[k]; ++k) {
            if (at + k >= source.size()) return false;
            if (std::tolower(static_cast<unsigned char>(source[at + k])) != word[k]) {
                return false;
            }
        }
        return true;
    }

    // Length in code points of the digit run at `at`; `end` receives its end
    size_t digit_run(size_t at, size_t& end) const {
        size_t n = 0;
        end = at;
        while (end < source.size()) {
            size_t next;
            UChar32 c = cp_at(end, next);
            if (!text::is_digit(c)) break;
            end = next;
            ++n;
        }
        return n;
    }

    size_t skip_whitespace(size_t at) const {
        while (at < source.size()) {
            size_t next;
            UChar32 c = cp_at(at, next);
            if (!text::is_space(c)) break;
            at = next;
        }
        return at;
    }

    void emit(TokenType type, size_t start, size_t end) {
        Token t(source.substr(start, end - start), type);
        t.offset = start;
        tokens.push_back(std::move(t));
    }

    TokenList run() {
        size_t lead = skip_whitespace(0);
        if (lead > 0) {
            emit(TokenType::Unknown, 0, lead);
            pos = lead;
        }

        while (!at_end()) {
            size_t start = pos;
            size_t end = 0;
            TokenType type = TokenType::Symbol;

            if ((end = match_url(start)))              type = TokenType::Url;
            else if ((end = match_email(start)))       type = TokenType::Email;
            else if ((end = match_phone(start)))       type = TokenType::Phone;
            else if ((end = match_date(start)))        type = TokenType::Date;
            else if ((end = match_time(start)))        type = TokenType::Time;
            else if ((end = match_number(start)))      type = TokenType::Number;
            else if ((end = match_technical(start)))   type = TokenType::Technical;
            else if ((end = match_script_run(start, is_subscript_digit)))
                type = TokenType::Subscript;
            else if ((end = match_script_run(start, is_superscript_digit)))
                type = TokenType::Superscript;
            else if ((end = match_word(start)))        type = TokenType::Word;
            else {
                cp_at(start, end);
                type = TokenType::Symbol;
            }

            emit(type, start, end);
            pos = skip_whitespace(end);
            tokens.back().whitespace_after = source.substr(end, pos - end);
        }

        return std::move(tokens);
    }

    // Each matcher returns the end offset of its pattern at `p`, or 0.

    size_t match_url(size_t p) const {
        size_t body;
        if (ascii_at_ci(p, "https://")) body = p + 8;
        else if (ascii_at_ci(p, "http://")) body = p + 7;
        else if (ascii_at_ci(p, "www.")) body = p + 4;
        else return 0;

        size_t end = body;
        std::vector<size_t> starts;
        while (end < source.size()) {
            size_t next;
            UChar32 c = cp_at(end, next);
            if (text::is_space(c)) break;
            starts.push_back(end);
            end = next;
        }
        // Give back trailing punctuation
        while (!starts.empty() && is_url_trailer(cp_at(starts.back()))) {
            end = starts.back();
            starts.pop_back();
        }
        if (end <= body) return 0;
        return end;
    }

    size_t match_email(size_t p) const {
        UChar32 first = cp_at(p);
        if (!text::is_letter(first) && !text::is_digit(first)) return 0;

        size_t at = p;
        while (at < source.size()) {
            size_t next;
            UChar32 c = cp_at(at, next);
            bool local = text::is_word_char(c) || c == '.' || c == '%' ||
                         c == '+' || c == '-';
            if (!local) break;
            at = next;
        }
        if (cp_at(at) != '@') return 0;
        ++at;

        size_t domain = at;
        size_t end = at;
        bool seen_dot = false;
        bool has_tld = false;
        while (at < source.size()) {
            size_t next;
            UChar32 c = cp_at(at, next);
            if (c == '.') {
                if (at == domain) return 0;
                seen_dot = true;
            } else if (text::is_letter(c) || text::is_digit(c) || text::is_mark(c)) {
                if (seen_dot) has_tld = true;
            } else if (c != '-') {
                break;
            }
            at = next;
            if (c != '.' && c != '-') end = at;
        }
        if (!has_tld) return 0;
        return end;
    }

    size_t match_phone(size_t p) const {
        UChar32 c = cp_at(p);
        size_t end;
        if (c == '+') {
            size_t n = digit_run(p + 1, end);
            if (n < 10 || n > 15) return 0;
        } else if (text::digit_value(c) == 0) {
            size_t second;
            cp_at(p, second);
            if (text::digit_value(cp_at(second)) != 7) return 0;
            size_t n = digit_run(p, end);
            if (n != 11) return 0;
        } else {
            return 0;
        }
        if (text::is_word_char(cp_at(end))) return 0;
        return end;
    }

    size_t match_date(size_t p) const {
        size_t end;
        size_t n0 = digit_run(p, end);
        if (n0 < 1 || n0 > 4) return 0;

        size_t next;
        UChar32 sep = cp_at(end, next);
        if (!is_date_separator(sep)) return 0;

        size_t n1 = digit_run(next, end);
        if (n1 < 1 || n1 > 2) return 0;
        if (cp_at(end, next) != sep) return 0;

        size_t n2 = digit_run(next, end);
        if (n2 < 1 || n2 > 4) return 0;

        // Reject longer dotted/dashed chains (versions, IPs)
        UChar32 after = cp_at(end, next);
        if (is_date_separator(after) && text::is_digit(cp_at(next))) return 0;
        if (text::is_word_char(after)) return 0;
        return end;
    }

    size_t match_time(size_t p) const {
        size_t end;
        size_t nh = digit_run(p, end);
        if (nh < 1 || nh > 2) return 0;

        size_t next;
        if (cp_at(end, next) != ':') return 0;
        if (digit_run(next, end) != 2) return 0;

        // Optional seconds
        size_t sec_end;
        if (cp_at(end, next) == ':' && digit_run(next, sec_end) == 2) {
            end = sec_end;
        }
        if (text::is_digit(cp_at(end))) return 0;

        // Inline am/pm marker
        static const char* markers[] = {"a.m.", "p.m.", "am", "pm"};
        for (const char* m : markers) {
            if (!ascii_at_ci(end, m)) continue;
            size_t marker_end = end + std::char_traits<char>::length(m);
            if (!text::is_word_char(cp_at(marker_end))) return marker_end;
        }
        return end;
    }

    // End of a run of three or more '.'-joined digit groups starting at `p`
    size_t match_dotted_sequence(size_t p) const {
        size_t end;
        if (digit_run(p, end) == 0) return 0;
        int groups = 1;
        while (true) {
            size_t next;
            if (cp_at(end, next) != '.') break;
            size_t group_end;
            if (digit_run(next, group_end) == 0) break;
            end = group_end;
            ++groups;
        }
        return groups >= 3 ? end : 0;
    }

    size_t match_number(size_t p) const {
        size_t end;
        size_t n = digit_run(p, end);
        if (n == 0) return 0;

        // Versions and IP addresses stay one token
        if (size_t dotted = match_dotted_sequence(p)) return dotted;

        // Thousands groups: ',' or U+066C followed by exactly three digits
        if (n <= 3) {
            while (true) {
                size_t next;
                UChar32 c = cp_at(end, next);
                if (c != ',' && c != 0x066C) break;
                size_t group_end;
                if (digit_run(next, group_end) != 3) break;
                end = group_end;
            }
        }

        // Decimal part
        {
            size_t next;
            UChar32 c = cp_at(end, next);
            size_t frac_end;
            if ((c == '.' || c == 0x066B) && digit_run(next, frac_end) > 0) {
                end = frac_end;
            }
        }

        // Exponent
        {
            size_t next;
            UChar32 c = cp_at(end, next);
            if (c == 'e' || c == 'E') {
                size_t exp_start = next;
                UChar32 sign = cp_at(exp_start, next);
                if (sign == '+' || sign == '-') exp_start = next;
                size_t exp_end;
                if (digit_run(exp_start, exp_end) > 0 &&
                    !text::is_letter(cp_at(exp_end))) {
                    end = exp_end;
                }
            }
        }
        return end;
    }

    size_t match_technical(size_t p) const {
        size_t next;
        UChar32 c = cp_at(p, next);
        if (c != '#' && c != '@') return 0;
        size_t end = next;
        while (end < source.size()) {
            size_t after;
            UChar32 w = cp_at(end, after);
            if (!text::is_word_char(w)) break;
            end = after;
        }
        return end > next ? end : 0;
    }

    size_t match_script_run(size_t p, bool (*pred)(UChar32)) const {
        size_t end = p;
        while (end < source.size()) {
            size_t next;
            if (!pred(cp_at(end, next))) break;
            end = next;
        }
        return end > p ? end : 0;
    }

    size_t match_word(size_t p) const {
        size_t next;
        UChar32 first = cp_at(p, next);
        if (!text::is_word_start(first)) return 0;

        // Digits only continue Latin-script words (codes like A1, v2)
        bool latin = text::script_of(first) == text::Script::Latin;
        size_t end = next;
        while (end < source.size()) {
            size_t after;
            UChar32 c = cp_at(end, after);
            if (text::is_digit(c)) {
                if (!latin) break;
            } else if (!text::is_word_char(c)) {
                break;
            }
            end = after;
        }
        return end;
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

TokenList tokenize(const std::string& text) {
    Lexer lexer(text);
    return lexer.run();
}

std::string detokenize(const TokenList& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (t.is_dead()) continue;
        out += t.text;
        out += t.whitespace_after;
    }
    return out;
}

} // namespace ckbtext
