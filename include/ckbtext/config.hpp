#pragma once

#include <ckbtext/result.hpp>
#include <optional>
#include <string>
#include <unordered_set>

namespace ckbtext {

enum class EmojiMode { Remove, Convert, Ignore };
enum class DiacriticsMode { Convert, Remove, Keep };
enum class ShaddaMode { Double, Remove };

const char* emoji_mode_name(EmojiMode m);
const char* diacritics_mode_name(DiacriticsMode m);
const char* shadda_mode_name(ShaddaMode m);

Result<EmojiMode> parse_emoji_mode(const std::string& s);
Result<DiacriticsMode> parse_diacritics_mode(const std::string& s);
Result<ShaddaMode> parse_shadda_mode(const std::string& s);

// Normalization settings. Built once per pipeline, read-only afterwards.
//
// TOML layout:
//   [modules]  numbers, web, phone, date-time, units, currency, technical,
//              math, diacritics, symbols, linguistics, transliteration,
//              pause-markers              (booleans)
//   [modes]    emoji, diacritics, shadda  (strings)
//   [numbers]  scientific-low, scientific-high
struct Config {
    bool numbers = true;
    bool web = true;
    bool phone = true;
    bool date_time = true;
    bool units = true;
    bool currency = true;
    bool technical = true;
    bool math = true;
    bool diacritics = true;
    bool symbols = true;
    bool linguistics = true;
    bool transliteration = true;
    bool pause_markers = false;

    EmojiMode emoji = EmojiMode::Remove;
    DiacriticsMode diacritics_mode = DiacriticsMode::Convert;
    ShaddaMode shadda = ShaddaMode::Double;

    // Magnitudes outside [scientific_low, scientific_high) are read in
    // scientific form
    double scientific_low = 1e-20;
    double scientific_high = 1e21;

    // TOML keys that were explicitly set (for merge)
    std::unordered_set<std::string> explicit_keys;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    // Rejects inconsistent numeric thresholds
    Status validate() const;

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// Discover the global config file path: ~/.ckbtext/config.toml
std::string global_config_path();

} // namespace ckbtext
