#pragma once
#include <string>
#include <string_view>
#include <map>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "src/util/util.hpp"

namespace seiscat {

    // extracted fields are strings, caller-attached ones may be numbers
    using FieldValue = std::variant<std::string, std::int64_t, double, Timestamp>;

    struct Record {
        std::string path;
        std::optional<Timestamp> time;
        std::map<std::string, FieldValue> fields;

        // "path" and "time" resolve to the dedicated members
        std::optional<FieldValue> get(std::string_view name) const;
        bool contains(std::string_view name) const { return get(name).has_value(); }
        void set(const std::string& name, FieldValue value);

        bool operator==(const Record& other) const = default;
    };

    bool is_numeric(const FieldValue& v);
    // numbers compare across int/double, other kinds only with themselves
    bool values_equal(const FieldValue& a, const FieldValue& b);
    // -1/0/1, nullopt when the two kinds have no order
    std::optional<int> compare_values(const FieldValue& a, const FieldValue& b);
    // total order for sorting: by kind first, then by value
    bool value_less(const FieldValue& a, const FieldValue& b);
    std::string format_value(const FieldValue& v);
    std::string value_type_name(const FieldValue& v);

    nlohmann::json value_to_json(const FieldValue& v);
    nlohmann::json record_to_json(const Record& r);
    nlohmann::json records_to_json(const std::vector<Record>& records);
} // namespace seiscat
