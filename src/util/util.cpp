#include "util.hpp"
#include <sstream>
#include <filesystem>
#include <date/date.h>

namespace seiscat {

    static const char* TIME_FORMATS[] = {
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%d"
    };

    std::string util::format_timestamp(const Timestamp& ts, const std::string& format) {
        return date::format(format.c_str(), ts);
    }

    std::optional<Timestamp> util::parse_timestamp(const std::string& text) {
        for (const char* format : TIME_FORMATS) {
            std::istringstream ss(text);
            Timestamp tp;
            // date::parse instead std::get_time
            ss >> date::parse(format, tp);
            if (ss.fail()) continue;
            // reject trailing garbage
            if (ss.peek() != std::char_traits<char>::eof()) continue;
            return tp;
        }
        return std::nullopt;
    }

    std::string util::normalize_path(const std::string& path) {
        if (path.empty()) return ".";
        std::string normalized = std::filesystem::path(path).lexically_normal().string();
        while (normalized.size() > 1 && normalized.back() == '/') normalized.pop_back();
        if (normalized.empty()) return ".";
        return normalized;
    }

    double util::get_micro_timestamp() {
        return std::chrono::duration<double, std::micro>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
} // namespace seiscat
