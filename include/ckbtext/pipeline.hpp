#pragma once

#include <ckbtext/config.hpp>
#include <ckbtext/module.hpp>
#include <ckbtext/result.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ckbtext {

// Ordered set of normalization passes built from a Config.
//
// Passes run highest priority first; tombstoned tokens are dropped after
// each pass. A pass that throws is logged and its changes discarded.
// Holds no per-call state, so one Pipeline can serve many sequential
// normalize() calls.
class Pipeline {
public:
    // Rejects an invalid configuration
    static Result<Pipeline> create(const Config& config = Config());

    Pipeline(Pipeline&&) = default;
    Pipeline& operator=(Pipeline&&) = default;

    // UTF-8 text in, spoken Kurdish out. Malformed UTF-8 is logged and its
    // bytes passed through as symbols.
    std::string normalize(const std::string& text) const;

    // As normalize(), but malformed UTF-8 is an Encoding error
    Result<std::string> normalize_checked(const std::string& text) const;

    // Run every pass over an already tokenized list
    void process(TokenList& tokens) const;

    const Config& config() const { return config_; }

    // Module names in execution order
    std::vector<std::string> module_names() const;

private:
    Pipeline() = default;

    std::string run(const std::string& text) const;

    template<typename M>
    void add() { modules_.push_back(std::make_unique<M>(config_)); }

    Config config_;
    std::vector<std::unique_ptr<Module>> modules_;
};

// One-shot convenience; an invalid config is logged and the text returned
// unchanged
std::string normalize_text(const std::string& text, const Config& config = Config());

// Spaces/tabs -> one space, CR/LF runs -> "\n", no spaces around newlines,
// trimmed
std::string canonicalize_whitespace(const std::string& s);

} // namespace ckbtext
