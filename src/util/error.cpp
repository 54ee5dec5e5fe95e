#include <ckbtext/error.hpp>
#include <ckbtext/text.hpp>
#include <algorithm>
#include <cstdio>

namespace ckbtext {

namespace {

const size_t kExcerptRadius = 12;

bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

// Valid characters verbatim, malformed bytes and controls as \xNN
std::string printable(const std::string& bytes) {
    std::string out;
    size_t i = 0;
    while (i < bytes.size()) {
        size_t start = i;
        UChar32 c = text::next_code_point(bytes, i);
        if (c >= 0x20 && c != 0x7F) {
            out.append(bytes, start, i - start);
            continue;
        }
        for (size_t k = start; k < i; ++k) {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(static_cast<unsigned char>(bytes[k])));
            out += buf;
        }
    }
    return out;
}

} // anonymous namespace

CkbError CkbError::in_text(Code c, std::string msg, const std::string& input, size_t at) {
    CkbError err(c, std::move(msg));
    err.offset = at;

    size_t begin = at > kExcerptRadius ? at - kExcerptRadius : 0;
    while (begin > 0 && is_continuation(static_cast<unsigned char>(input[begin]))) --begin;
    size_t end = std::min(input.size(), at + kExcerptRadius);
    while (end < input.size() && is_continuation(static_cast<unsigned char>(input[end]))) ++end;
    if (begin < end) err.excerpt = printable(input.substr(begin, end - begin));
    return err;
}

const char* CkbError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
        case Encoding:   return "Encoding";
    }
    return "Unknown";
}

std::string CkbError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    } else if (offset != npos) {
        result += "\n  --> input byte ";
        result += std::to_string(offset);
        if (!excerpt.empty()) {
            result += ": ";
            result += excerpt;
        }
    } else if (line > 0) {
        result += "\n  --> line ";
        result += std::to_string(line);
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }
    return result;
}

} // namespace ckbtext
