#include <ckbtext/pipeline.hpp>
#include <ckbtext/log.hpp>
#include <ckbtext/text.hpp>
#include <ckbtext/tokenizer.hpp>
#include <ckbtext/modules/currency.hpp>
#include <ckbtext/modules/date_time.hpp>
#include <ckbtext/modules/diacritics.hpp>
#include <ckbtext/modules/emoji.hpp>
#include <ckbtext/modules/grammar.hpp>
#include <ckbtext/modules/linguistics.hpp>
#include <ckbtext/modules/math.hpp>
#include <ckbtext/modules/number.hpp>
#include <ckbtext/modules/phone.hpp>
#include <ckbtext/modules/spacing.hpp>
#include <ckbtext/modules/symbol.hpp>
#include <ckbtext/modules/technical.hpp>
#include <ckbtext/modules/transliteration.hpp>
#include <ckbtext/modules/unit.hpp>
#include <ckbtext/modules/web.hpp>
#include <algorithm>
#include <exception>

namespace ckbtext {

namespace {
const log::Channel kLog("pipeline");
}

Result<Pipeline> Pipeline::create(const Config& config) {
    CKBTEXT_TRY(config.validate());

    Pipeline p;
    p.config_ = config;

    // Registration order breaks priority ties
    if (config.web)             p.add<WebModule>();
    if (config.phone)           p.add<PhoneModule>();
    if (config.date_time)       p.add<DateTimeModule>();
    if (config.technical)       p.add<TechnicalModule>();
    if (config.units)           p.add<UnitTaggerModule>();
    if (config.math)            p.add<MathModule>();
    if (config.currency)        p.add<CurrencyModule>();
    if (config.units)           p.add<UnitModule>();
    if (config.numbers)         p.add<NumberModule>();
    p.add<EmojiModule>();
    if (config.symbols)         p.add<SymbolModule>();
    if (config.diacritics)      p.add<DiacriticsModule>();
    p.add<ScriptTaggerModule>();
    p.add<GrammarModule>();
    if (config.linguistics)     p.add<LinguisticsModule>();
    if (config.transliteration) p.add<TransliterationModule>();
    p.add<SpacingModule>();

    std::stable_sort(p.modules_.begin(), p.modules_.end(),
                     [](const std::unique_ptr<Module>& a, const std::unique_ptr<Module>& b) {
                         return a->priority() > b->priority();
                     });

    for (const auto& m : p.modules_) {
        kLog.debug("module %s (priority %d)", m->name(), m->priority());
    }
    return Result<Pipeline>::ok(std::move(p));
}

void Pipeline::process(TokenList& tokens) const {
    for (const auto& m : modules_) {
        TokenList before = tokens;
        try {
            m->process(tokens);
        } catch (const std::exception& e) {
            m->logger().warn("pass failed, changes discarded: %s", e.what());
            tokens = std::move(before);
            continue;
        }
        compact(tokens);
        m->logger().trace("%zu tokens", tokens.size());
    }
}

std::string Pipeline::normalize(const std::string& text) const {
    auto valid = text::check_utf8(text);
    if (valid.is_err()) {
        kLog.warn("%s", valid.error().format().c_str());
    }
    return run(text);
}

Result<std::string> Pipeline::normalize_checked(const std::string& text) const {
    CKBTEXT_TRY(text::check_utf8(text));
    return Result<std::string>::ok(run(text));
}

std::string Pipeline::run(const std::string& text) const {
    if (text.empty()) return text;
    TokenList tokens = tokenize(text);
    kLog.trace("tokenized %zu bytes into %zu tokens", text.size(), tokens.size());
    process(tokens);
    return canonicalize_whitespace(detokenize(tokens));
}

std::vector<std::string> Pipeline::module_names() const {
    std::vector<std::string> names;
    names.reserve(modules_.size());
    for (const auto& m : modules_) names.push_back(m->name());
    return names;
}

std::string normalize_text(const std::string& text, const Config& config) {
    auto pipeline = Pipeline::create(config);
    if (pipeline.is_err()) {
        kLog.error("%s", pipeline.error().format().c_str());
        return text;
    }
    return pipeline.value().normalize(text);
}

std::string canonicalize_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool space = false;
    bool newline = false;
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            space = true;
            continue;
        }
        if (c == '\r' || c == '\n') {
            newline = true;
            continue;
        }
        if (!out.empty()) {
            if (newline) out += '\n';
            else if (space) out += ' ';
        }
        space = newline = false;
        out += c;
    }
    return out;
}

} // namespace ckbtext
