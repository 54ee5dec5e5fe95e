#pragma once

#include <cstddef>
#include <string>

namespace ckbtext {

// Failure of a fallible ckbtext operation. Configuration problems point into
// a TOML file by line; text problems point into the input by byte offset.
struct CkbError {
    enum Code {
        IO,          // config or input file unreadable
        Parse,       // malformed TOML
        Config,      // well-formed TOML with a bad key or value
        InvalidArg,  // bad command-line or API argument
        Encoding     // input text is not valid UTF-8
    };

    static constexpr size_t npos = static_cast<size_t>(-1);

    Code code = InvalidArg;
    std::string message;
    std::string hint;

    // Config file location
    std::string file;
    int line = 0;

    // Input text location, with the bytes around it
    size_t offset = npos;
    std::string excerpt;

    CkbError() = default;
    CkbError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CkbError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CkbError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Error at byte `at` of `input`; the excerpt keeps a few whole
    // characters on either side
    static CkbError in_text(Code c, std::string msg, const std::string& input, size_t at);

    bool has_location() const { return !file.empty() || offset != npos; }

    // error[Code]: message
    //   --> file:line            or   --> input byte N: excerpt
    //   hint: ...
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ckbtext
