#include <ckbtext/modules/number.hpp>
#include <ckbtext/log.hpp>
#include <ckbtext/numbers.hpp>
#include <ckbtext/text.hpp>

namespace ckbtext {

namespace {

bool is_kurdish_word(const Token* t) {
    return t && !t->is_dead() && !t->is_converted && t->type == TokenType::Word &&
           text::script_of(t->text) == text::Script::Arabic;
}

// Sign directly attached to the number: a bare "-" not preceded by a
// number, or a "سالب" the math pass already produced
bool is_attached_minus(const TokenList& tokens, long i) {
    const Token* sign = token_at(tokens, i - 1);
    if (!sign || sign->is_dead() || !is_tight(*sign)) return false;

    if (sign->is_converted) {
        return sign->has_tag(tags::MathOperator) && sign->text == words::Minus;
    }
    if (sign->text != "-" && sign->text != "−") return false;
    const Token* before = token_at(tokens, i - 2);
    return !(before && !before->is_dead() && is_numeric(*before));
}

} // anonymous namespace

void NumberModule::process(TokenList& tokens) const {
    NumberReadingOptions opts{config().scientific_low, config().scientific_high};

    for (long i = 0; i < static_cast<long>(tokens.size()); ++i) {
        Token& t = tokens[static_cast<size_t>(i)];
        if (t.is_dead() || t.is_converted || t.type != TokenType::Number) continue;

        if (auto dotted = dotted_sequence_to_words(t.text)) {
            t.rewrite(*dotted);
            continue;
        }

        auto reading = number_to_words(t.text, opts);
        if (!reading) {
            logger().debug("leaving unparseable number '%s'", t.text.c_str());
            continue;
        }
        std::string spoken = *reading;

        // "2.5 کیلۆ" -> "دوو کیلۆ و نیو"
        Token* next = token_at(tokens, i + 1);
        auto parts = split_number(t.text);
        if (parts && !parts->negative && parts->fraction == "5" && parts->integer.size() == 1 &&
            parts->integer != "0" && !parts->has_exponent && is_kurdish_word(next)) {
            spoken = integer_to_words(parts->integer);
            next->text += std::string(words::And) + words::Half;
        }

        if (is_attached_minus(tokens, i)) {
            Token& sign = tokens[static_cast<size_t>(i - 1)];
            spoken = std::string(words::Minus) + " " + spoken;
            sign.erase();
        }

        t.rewrite(spoken);
    }
}

} // namespace ckbtext
