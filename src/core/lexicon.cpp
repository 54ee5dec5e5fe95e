#include <ckbtext/lexicon.hpp>
#include <unordered_map>

namespace ckbtext::lexicon {

const char* letter_name(UChar32 c) {
    static const char* const names[26] = {
        "ئەی", "بی", "سی", "دی", "ئی", "ئێف", "جی", "ئێچ", "ئای",
        "جەی", "کەی", "ئێل", "ئێم", "ئێن", "ئۆ", "پی", "کیو", "ئاڕ",
        "ئێس", "تی", "یو", "ڤی", "دەبڵیو", "ئێکس", "وای", "زێد"
    };
    if (c >= 'A' && c <= 'Z') return names[c - 'A'];
    if (c >= 'a' && c <= 'z') return names[c - 'a'];
    return nullptr;
}

const char* greek_letter_name(UChar32 c) {
    static const std::unordered_map<UChar32, const char*> names = {
        {0x03B1, "ئەلفا"},    {0x03B2, "بێتا"},    {0x03B3, "گاما"},
        {0x03B4, "دێلتا"},    {0x03B5, "ئێپسیلۆن"}, {0x03B6, "زێتا"},
        {0x03B7, "ئیتا"},     {0x03B8, "سیتا"},    {0x03B9, "یۆتا"},
        {0x03BA, "کاپا"},     {0x03BB, "لامبدا"},  {0x03BC, "میو"},
        {0x00B5, "میو"},      {0x03BD, "نیو"},     {0x03BE, "کسای"},
        {0x03BF, "ئۆمیکرۆن"}, {0x03C0, "پای"},     {0x03C1, "ڕۆ"},
        {0x03C2, "سیگما"},    {0x03C3, "سیگما"},   {0x03C4, "تاو"},
        {0x03C5, "ئوپسیلۆن"}, {0x03C6, "فای"},     {0x03C7, "کای"},
        {0x03C8, "پسای"},     {0x03C9, "ئۆمیگا"},
    };
    UChar32 lower = c;
    if (c >= 0x0391 && c <= 0x03A9 && c != 0x03A2) lower = c + 0x20;
    auto it = names.find(lower);
    return it == names.end() ? nullptr : it->second;
}

std::optional<std::string> english_word(const std::string& lower) {
    static const std::unordered_map<std::string, std::string> words = {
        // Web vocabulary
        {"www", "دەبڵیو دەبڵیو دەبڵیو"},
        {"http", "ئێچ تی تی پی"},
        {"https", "ئێچ تی تی پی ئێس"},
        {"ftp", "ئێف تی پی"},
        {"com", "کۆم"},
        {"net", "نێت"},
        {"org", "ئۆرگ"},
        {"edu", "ئێدیو"},
        {"gov", "گۆڤ"},
        {"info", "ئینفۆ"},
        {"html", "ئێچ تی ئێم ئێل"},
        {"gmail", "جیمەیڵ"},
        {"hotmail", "ھۆتمەیڵ"},
        {"yahoo", "یاھوو"},
        {"outlook", "ئاوتلووک"},
        {"google", "گووگڵ"},
        {"facebook", "فەیسبووک"},
        {"youtube", "یوتیوب"},
        {"instagram", "ئینستاگرام"},
        {"twitter", "تویتەر"},
        {"telegram", "تێلێگرام"},
        {"whatsapp", "واتسئەپ"},
        {"github", "گیتھەب"},
        {"wikipedia", "ویکیپیدیا"},
        {"user", "یوسەر"},
        {"admin", "ئەدمین"},
        {"mail", "مەیڵ"},
        {"email", "ئیمەیڵ"},
        {"index", "ئیندێکس"},
        {"home", "ھۆم"},
        {"news", "نیوز"},
        // Common words
        {"phone", "فۆن"},
        {"iphone", "ئایفۆن"},
        {"mobile", "مۆبایل"},
        {"computer", "کۆمپیوتەر"},
        {"internet", "ئینتەرنێت"},
        {"online", "ئۆنلاین"},
        {"apple", "ئەپڵ"},
        {"microsoft", "مایکرۆسۆفت"},
        {"windows", "ویندۆز"},
        {"hello", "ھێلۆ"},
        {"ok", "ئۆکەی"},
        {"okay", "ئۆکەی"},
        {"thanks", "سانکس"},
        {"the", "دە"},
        {"and", "ئەند"},
        {"app", "ئەپ"},
        {"video", "ڤیدیۆ"},
        {"wifi", "وایفای"},
        {"bluetooth", "بلوتووس"},
    };
    auto it = words.find(lower);
    if (it == words.end()) return std::nullopt;
    return it->second;
}

const char* romanize(UChar32 c) {
    static const std::unordered_map<UChar32, const char*> table = {
        // Cyrillic
        {0x0430, "a"},  {0x0431, "b"},  {0x0432, "v"},  {0x0433, "g"},
        {0x0434, "d"},  {0x0435, "e"},  {0x0451, "yo"}, {0x0436, "zh"},
        {0x0437, "z"},  {0x0438, "i"},  {0x0439, "y"},  {0x043A, "k"},
        {0x043B, "l"},  {0x043C, "m"},  {0x043D, "n"},  {0x043E, "o"},
        {0x043F, "p"},  {0x0440, "r"},  {0x0441, "s"},  {0x0442, "t"},
        {0x0443, "u"},  {0x0444, "f"},  {0x0445, "kh"}, {0x0446, "ts"},
        {0x0447, "ch"}, {0x0448, "sh"}, {0x0449, "shch"}, {0x044A, ""},
        {0x044B, "i"},  {0x044C, ""},   {0x044D, "e"},  {0x044E, "yu"},
        {0x044F, "ya"}, {0x0456, "i"},  {0x0457, "yi"}, {0x0454, "ye"},
        {0x0491, "g"},
        // Greek
        {0x03B1, "a"},  {0x03B2, "v"},  {0x03B3, "g"},  {0x03B4, "d"},
        {0x03B5, "e"},  {0x03B6, "z"},  {0x03B7, "i"},  {0x03B8, "th"},
        {0x03B9, "i"},  {0x03BA, "k"},  {0x03BB, "l"},  {0x03BC, "m"},
        {0x03BD, "n"},  {0x03BE, "x"},  {0x03BF, "o"},  {0x03C0, "p"},
        {0x03C1, "r"},  {0x03C2, "s"},  {0x03C3, "s"},  {0x03C4, "t"},
        {0x03C5, "i"},  {0x03C6, "f"},  {0x03C7, "kh"}, {0x03C8, "ps"},
        {0x03C9, "o"},
    };
    auto it = table.find(c);
    return it == table.end() ? nullptr : it->second;
}

} // namespace ckbtext::lexicon
