#include "time_resolver.hpp"
#include <chrono>
#include <date/date.h>
#include <charconv>
#include <stdexcept>
#include <sstream>
#include <spdlog/spdlog.h>

namespace seiscat {

    static std::string describe(const std::map<std::string, FieldValue>& fields) {
        std::ostringstream oss;
        oss << "{";
        bool first = true;
        for (const auto& [name, value] : fields) {
            if (!first) oss << ", ";
            first = false;
            oss << name << "=" << format_value(value);
        }
        oss << "}";
        return oss.str();
    }

    // nullopt: field absent; throws std::invalid_argument when present but not a number
    static std::optional<int> int_field(const std::map<std::string, FieldValue>& fields, const std::string& name) {
        auto it = fields.find(name);
        if (it == fields.end()) return std::nullopt;
        if (auto* i = std::get_if<std::int64_t>(&it->second)) return static_cast<int>(*i);
        const auto* s = std::get_if<std::string>(&it->second);
        if (!s || s->empty()) throw std::invalid_argument(name + " is not an integer");
        int value = 0;
        auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), value);
        if (ec != std::errc() || ptr != s->data() + s->size()) {
            throw std::invalid_argument(name + " '" + *s + "' is not an integer");
        }
        return value;
    }

    std::optional<Timestamp> gen_time_from_fields(const std::map<std::string, FieldValue>& fields) {
        std::optional<int> year, month, day, jday;
        int hour = 0;
        int minute = 0;
        try {
            year = int_field(fields, "year");
            month = int_field(fields, "month");
            day = int_field(fields, "day");
            jday = int_field(fields, "jday");
            hour = int_field(fields, "hour").value_or(0);
            minute = int_field(fields, "minute").value_or(0);
        } catch (const std::invalid_argument& e) {
            spdlog::error("Invalid time fields: {}, error: {}", describe(fields), e.what());
            return std::nullopt;
        }

        // two digit years are 20YY
        if (year) {
            auto it = fields.find("year");
            const auto* s = std::get_if<std::string>(&it->second);
            if (s && s->size() == 2) year = 2000 + *year;
        }

        // zero counts as absent for year, jday, month and day
        if (year && *year && jday && *jday) {
            // jday and hour/minute are offsets from Jan 1, overflow rolls forward
            date::year y(*year);
            if (!y.ok()) {
                spdlog::error("Invalid jday or date fields: {}", describe(fields));
                return std::nullopt;
            }
            date::sys_days jan1 = y / date::January / 1;
            return Timestamp(jan1 + date::days(*jday - 1)) + std::chrono::hours(hour) + std::chrono::minutes(minute);
        } else if (year && *year && month && *month && day && *day) {
            date::year_month_day ymd{date::year(*year), date::month(static_cast<unsigned>(*month)),
                                     date::day(static_cast<unsigned>(*day))};
            if (*month < 1 || *day < 1 || !ymd.ok() || hour < 0 || hour > 23 || minute < 0 || minute > 59) {
                spdlog::error("Invalid date fields: {}", describe(fields));
                return std::nullopt;
            }
            return Timestamp(date::sys_days(ymd)) + std::chrono::hours(hour) + std::chrono::minutes(minute);
        }
        spdlog::error("Insufficient time fields: {}", describe(fields));
        return std::nullopt;
    }
} // namespace seiscat
