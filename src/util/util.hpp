#pragma once
#include <string>
#include <chrono>
#include <optional>

namespace seiscat {
    using Timestamp = std::chrono::sys_seconds;

    class util {
    public:
        // ISO-8601 like rendering, e.g. 2023-01-02T00:00:00
        static std::string format_timestamp(const Timestamp& ts, const std::string& format = "%Y-%m-%dT%H:%M:%S");
        // try the supported formats in order, nullopt if none parses the whole string
        static std::optional<Timestamp> parse_timestamp(const std::string& text);
        // lexically normalized path without trailing separator
        static std::string normalize_path(const std::string& path);
        static double get_micro_timestamp();
    };
} // namespace seiscat
