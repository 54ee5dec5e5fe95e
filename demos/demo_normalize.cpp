// demo_normalize.cpp
//
// Reads Sorani Kurdish text from a file (or stdin) and prints the spoken
// form produced by the default normalization pipeline.
//
//     ./ckbtext-normalize input.txt
//     echo "Hello 123!" | ./ckbtext-normalize
//     ./ckbtext-normalize --config settings.toml --log-level debug input.txt
//     ./ckbtext-normalize --log-level trace:math,unit input.txt
//
// Without --config the global ~/.ckbtext/config.toml is used when present.

#include <ckbtext/config.hpp>
#include <ckbtext/log.hpp>
#include <ckbtext/pipeline.hpp>
#include <ckbtext/result.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace ckbtext;

struct Options {
    std::string input;          // empty -> stdin
    std::string config_path;
};

// ---------------------------------------------------------------------------
// Argument handling
// ---------------------------------------------------------------------------

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--log-level") {
            if (i + 1 >= argc) {
                return CkbError{CkbError::InvalidArg, "missing value for " + arg,
                                "usage: ckbtext-normalize [--config <file>] "
                                "[--log-level <level>[:pass,...]] [input]"};
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                opts.config_path = value;
                continue;
            }
            if (!log::configure(value)) {
                return CkbError{CkbError::InvalidArg, "unknown log level: " + value,
                                "expected trace, debug, info, warn or error, "
                                "optionally followed by :pass,pass"};
            }
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            return CkbError{CkbError::InvalidArg, "unknown option: " + arg};
        } else if (opts.input.empty() && arg != "-") {
            opts.input = arg;
        }
    }
    return Result<Options>::ok(std::move(opts));
}

Result<std::string> read_input(const std::string& path) {
    std::ostringstream buf;
    if (path.empty()) {
        buf << std::cin.rdbuf();
        return Result<std::string>::ok(buf.str());
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return CkbError{CkbError::IO, "could not open file: " + path,
                        "check the path and file permissions"};
    }
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

// Explicit --config wins; otherwise layer the global file over defaults
Result<Config> resolve_config(const Options& opts) {
    if (!opts.config_path.empty()) {
        auto local = Config::load(opts.config_path);
        CKBTEXT_TRY(local);
        return Result<Config>::ok(Config::effective(std::nullopt, local.value()));
    }

    std::string global_path = global_config_path();
    std::error_code ec;
    if (global_path.empty() || !fs::exists(global_path, ec)) {
        return Result<Config>::ok(Config());
    }
    auto global = Config::load(global_path);
    CKBTEXT_TRY(global);
    log::debug("using global config %s", global_path.c_str());
    return Result<Config>::ok(Config::effective(global.value(), std::nullopt));
}

Result<std::string> run(int argc, char** argv) {
    CKBTEXT_ASSIGN_OR_RETURN(Options opts, parse_args(argc, argv));
    CKBTEXT_ASSIGN_OR_RETURN(Config config, resolve_config(opts));
    CKBTEXT_ASSIGN_OR_RETURN(Pipeline pipeline, Pipeline::create(config));
    CKBTEXT_ASSIGN_OR_RETURN(std::string input, read_input(opts.input));
    log::info("read %zu bytes", input.size());

    return pipeline.normalize_checked(input);
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    std::cout << result.value() << "\n";
    return 0;
}
