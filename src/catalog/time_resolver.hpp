#pragma once
#include <map>
#include <string>
#include <optional>
#include "record.hpp"

namespace seiscat {
    // Derive a timestamp from the year/month/day/jday/hour/minute groups of an
    // extracted field map. Day-of-year wins over month/day; a two digit year is
    // taken as 20YY; missing hour/minute count as zero. Day-of-year, hour and
    // minute are offsets from Jan 1 and roll over into the next day or year.
    // Returns nullopt (and logs) when the fields are insufficient or the
    // year/month/day do not form a valid date.
    std::optional<Timestamp> gen_time_from_fields(const std::map<std::string, FieldValue>& fields);
} // namespace seiscat
