#pragma once

#include <ckbtext/module.hpp>
#include <optional>
#include <string>

namespace ckbtext {

struct DateParts {
    long long day = 0;
    long long month = 0;
    long long year = 0;
};

enum class DayHalf { None, Am, Pm, Night };

class DateTimeModule : public Module {
public:
    using Module::Module;
    const char* name() const override { return "date-time"; }
    int priority() const override { return 95; }
    void process(TokenList& tokens) const override;

    // Resolve field order of "2025/12/03", "03-12-2025", "12.03.2025"
    static std::optional<DateParts> parse_date(const std::string& literal);

    static std::string speak_date(const DateParts& d);

    // Spoken time for hour:minute with an optional am/pm/night signal
    static std::string speak_time(long long hour, long long minute, DayHalf half);

    // Period label for a 24-hour value ("نیوەڕۆ" for 12..13)
    static const char* day_period(long long hour24);

    // Classify a day-half marker after whitespace/joiner removal,
    // e.g. "PM", "د.ن", "دواینیوەڕۆ"; `remainder` receives what follows it
    static DayHalf match_marker(const std::string& compact, std::string& remainder);
};

} // namespace ckbtext
