#pragma once

#include <ckbtext/config.hpp>
#include <ckbtext/log.hpp>
#include <ckbtext/token.hpp>

namespace ckbtext {

// One normalization pass over the token list. Modules may rewrite, split,
// merge or tombstone tokens but keep unrelated tokens in order, and must
// not throw.
class Module {
public:
    explicit Module(const Config& config) : config_(config) {}
    virtual ~Module() = default;

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    virtual const char* name() const = 0;

    // Higher runs earlier
    virtual int priority() const = 0;

    virtual void process(TokenList& tokens) const = 0;

    // Log channel named after the pass
    log::Channel logger() const { return log::Channel(name()); }

protected:
    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace ckbtext
