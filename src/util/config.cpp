#include <ckbtext/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace ckbtext {

namespace {

using BoolField = std::pair<const char*, bool Config::*>;

const std::vector<BoolField>& module_fields() {
    static const std::vector<BoolField> fields = {
        {"numbers",         &Config::numbers},
        {"web",             &Config::web},
        {"phone",           &Config::phone},
        {"date-time",       &Config::date_time},
        {"units",           &Config::units},
        {"currency",        &Config::currency},
        {"technical",       &Config::technical},
        {"math",            &Config::math},
        {"diacritics",      &Config::diacritics},
        {"symbols",         &Config::symbols},
        {"linguistics",     &Config::linguistics},
        {"transliteration", &Config::transliteration},
        {"pause-markers",   &Config::pause_markers},
    };
    return fields;
}

} // anonymous namespace

const char* emoji_mode_name(EmojiMode m) {
    switch (m) {
        case EmojiMode::Remove:  return "remove";
        case EmojiMode::Convert: return "convert";
        case EmojiMode::Ignore:  return "ignore";
    }
    return "?";
}

const char* diacritics_mode_name(DiacriticsMode m) {
    switch (m) {
        case DiacriticsMode::Convert: return "convert";
        case DiacriticsMode::Remove:  return "remove";
        case DiacriticsMode::Keep:    return "keep";
    }
    return "?";
}

const char* shadda_mode_name(ShaddaMode m) {
    switch (m) {
        case ShaddaMode::Double: return "double";
        case ShaddaMode::Remove: return "remove";
    }
    return "?";
}

Result<EmojiMode> parse_emoji_mode(const std::string& s) {
    if (s == "remove")  return Result<EmojiMode>::ok(EmojiMode::Remove);
    if (s == "convert") return Result<EmojiMode>::ok(EmojiMode::Convert);
    if (s == "ignore")  return Result<EmojiMode>::ok(EmojiMode::Ignore);
    return CkbError{CkbError::Config,
        "invalid emoji mode '" + s + "'",
        "expected one of: remove, convert, ignore"};
}

Result<DiacriticsMode> parse_diacritics_mode(const std::string& s) {
    if (s == "convert") return Result<DiacriticsMode>::ok(DiacriticsMode::Convert);
    if (s == "remove")  return Result<DiacriticsMode>::ok(DiacriticsMode::Remove);
    if (s == "keep")    return Result<DiacriticsMode>::ok(DiacriticsMode::Keep);
    return CkbError{CkbError::Config,
        "invalid diacritics mode '" + s + "'",
        "expected one of: convert, remove, keep"};
}

Result<ShaddaMode> parse_shadda_mode(const std::string& s) {
    if (s == "double") return Result<ShaddaMode>::ok(ShaddaMode::Double);
    if (s == "remove") return Result<ShaddaMode>::ok(ShaddaMode::Remove);
    return CkbError{CkbError::Config,
        "invalid shadda mode '" + s + "'",
        "expected one of: double, remove"};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        CkbError err{CkbError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        return err;
    }

    Config cfg;

    // [modules] section
    if (auto mods = doc["modules"].as_table()) {
        for (const auto& [key, val] : *mods) {
            std::string k(key);
            bool known = false;
            for (const auto& [name, field] : module_fields()) {
                if (k != name) continue;
                known = true;
                auto b = val.value<bool>();
                if (!b) {
                    return CkbError{CkbError::Config,
                        "modules." + k + " must be a boolean"};
                }
                cfg.*field = *b;
                cfg.explicit_keys.insert(k);
            }
            if (!known) {
                return CkbError{CkbError::Config,
                    "unknown module toggle '" + k + "'"};
            }
        }
    }

    // [modes] section
    if (auto modes = doc["modes"].as_table()) {
        for (const auto& [key, val] : *modes) {
            std::string k(key);
            if (k != "emoji" && k != "diacritics" && k != "shadda") {
                return CkbError{CkbError::Config,
                    "unknown mode '" + k + "'",
                    "expected one of: emoji, diacritics, shadda"};
            }
            auto v = val.value<std::string>();
            if (!v) {
                return CkbError{CkbError::Config,
                    "modes." + k + " must be a string"};
            }
            if (k == "emoji") {
                auto m = parse_emoji_mode(*v);
                CKBTEXT_TRY(m);
                cfg.emoji = m.value();
                cfg.explicit_keys.insert("emoji");
            } else if (k == "diacritics") {
                auto m = parse_diacritics_mode(*v);
                CKBTEXT_TRY(m);
                cfg.diacritics_mode = m.value();
                cfg.explicit_keys.insert("diacritics-mode");
            } else {
                auto m = parse_shadda_mode(*v);
                CKBTEXT_TRY(m);
                cfg.shadda = m.value();
                cfg.explicit_keys.insert("shadda");
            }
        }
    }

    // [numbers] section
    if (auto nums = doc["numbers"].as_table()) {
        for (const auto& [key, val] : *nums) {
            std::string k(key);
            if (k != "scientific-low" && k != "scientific-high") {
                return CkbError{CkbError::Config,
                    "unknown number setting '" + k + "'",
                    "expected one of: scientific-low, scientific-high"};
            }
            auto v = val.value<double>();
            if (!v) {
                return CkbError{CkbError::Config,
                    "numbers." + k + " must be a number"};
            }
            if (k == "scientific-low") cfg.scientific_low = *v;
            else cfg.scientific_high = *v;
            cfg.explicit_keys.insert(k);
        }
    }

    CKBTEXT_TRY(cfg.validate());
    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CkbError{CkbError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
    }
    return r;
}

Status Config::validate() const {
    if (!(scientific_low > 0.0)) {
        return CkbError{CkbError::Config,
            "numbers.scientific-low must be positive"};
    }
    if (!(scientific_high > scientific_low)) {
        return CkbError{CkbError::Config,
            "numbers.scientific-high must be greater than scientific-low"};
    }
    return ok_status();
}

void Config::merge(const Config& other) {
    for (const auto& [name, field] : module_fields()) {
        if (other.explicit_keys.count(name)) {
            this->*field = other.*field;
            explicit_keys.insert(name);
        }
    }
    if (other.explicit_keys.count("emoji")) {
        emoji = other.emoji;
        explicit_keys.insert("emoji");
    }
    if (other.explicit_keys.count("diacritics-mode")) {
        diacritics_mode = other.diacritics_mode;
        explicit_keys.insert("diacritics-mode");
    }
    if (other.explicit_keys.count("shadda")) {
        shadda = other.shadda;
        explicit_keys.insert("shadda");
    }
    if (other.explicit_keys.count("scientific-low")) {
        scientific_low = other.scientific_low;
        explicit_keys.insert("scientific-low");
    }
    if (other.explicit_keys.count("scientific-high")) {
        scientific_high = other.scientific_high;
        explicit_keys.insert("scientific-high");
    }
}

Config Config::effective(const std::optional<Config>& global,
                          const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ckbtext/config.toml";
}

} // namespace ckbtext
