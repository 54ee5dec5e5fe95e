#include <ckbtext/modules/emoji.hpp>
#include <ckbtext/text.hpp>
#include <unicode/uchar.h>
#include <unordered_map>

namespace ckbtext {

namespace {

bool is_emoji_base(UChar32 c) {
    if (c >= 0x1F1E6 && c <= 0x1F1FF) return true;   // regional indicators
    return c >= 0x2000 && u_hasBinaryProperty(c, UCHAR_EXTENDED_PICTOGRAPHIC);
}

// Code points that only decorate an emoji sequence
bool is_emoji_component(UChar32 c) {
    return c == 0xFE0F || c == 0xFE0E || c == text::kZwj || c == 0x20E3 ||
           (c >= 0x1F3FB && c <= 0x1F3FF) || (c >= 0xE0020 && c <= 0xE007F);
}

bool is_emoji_text(const std::string& s, bool& has_base) {
    has_base = false;
    auto cps = text::decode(s);
    if (cps.empty()) return false;
    for (UChar32 c : cps) {
        if (is_emoji_base(c)) has_base = true;
        else if (!is_emoji_component(c)) return false;
    }
    return true;
}

const char* emoji_name(UChar32 c) {
    static const std::unordered_map<UChar32, const char*> names = {
        {0x1F600, "دەموچاوی پێکەنین"},
        {0x1F602, "پێکەنین بە فرمێسکەوە"},
        {0x1F60A, "زەردەخەنە"},
        {0x1F642, "زەردەخەنە"},
        {0x1F60D, "خۆشەویستی"},
        {0x1F622, "گریان"},
        {0x1F62D, "گریانی بەکوڵ"},
        {0x1F621, "توڕەیی"},
        {0x1F60E, "چاویلکەی خۆر"},
        {0x1F914, "بیرکردنەوە"},
        {0x1F44D, "پەنجەی گەورە بۆ سەرەوە"},
        {0x1F44E, "پەنجەی گەورە بۆ خوارەوە"},
        {0x1F44F, "چەپڵە"},
        {0x1F64F, "سوپاس"},
        {0x2764, "دڵ"},
        {0x1F494, "دڵی شکاو"},
        {0x1F525, "ئاگر"},
        {0x2B50, "ئەستێرە"},
        {0x1F339, "گوڵ"},
        {0x1F389, "ئاھەنگ"},
        {0x2705, "نیشانەی ڕاست"},
        {0x274C, "نیشانەی ھەڵە"},
        {0x2600, "خۆر"},
        {0x1F319, "مانگ"},
        {0x1F4AF, "سەد لە سەد"},
    };
    auto it = names.find(c);
    return it == names.end() ? nullptr : it->second;
}

} // anonymous namespace

void EmojiModule::process(TokenList& tokens) const {
    EmojiMode mode = config().emoji;
    if (mode == EmojiMode::Ignore) return;

    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.is_dead() || t.is_converted || t.type != TokenType::Symbol) continue;

        bool has_base = false;
        if (!is_emoji_text(t.text, has_base)) continue;

        if (mode == EmojiMode::Convert && has_base) {
            const char* name = emoji_name(text::decode(t.text)[0]);
            if (name) {
                // Drop the modifiers and ZWJ continuation glued to it
                size_t k = i + 1;
                while (k < tokens.size() && is_tight(tokens[k - 1])) {
                    bool base = false;
                    if (!is_emoji_text(tokens[k].text, base) || base) break;
                    t.whitespace_after = tokens[k].whitespace_after;
                    tokens[k].erase();
                    ++k;
                }
                t.rewrite(name);
                i = k - 1;
                continue;
            }
        }
        erase_keeping_space(tokens, i);
    }
}

} // namespace ckbtext
