#pragma once
#include <map>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <nlohmann/json.hpp>
#include "record.hpp"

namespace seiscat {

    enum class CriterionMode {
        LIST,
        RANGE
    };

    // One field's predicate as configured: membership in values (LIST) or
    // inside any inclusive pair of consecutive values (RANGE).
    struct CriterionSpec {
        CriterionMode mode{CriterionMode::LIST};
        std::optional<std::string> data_type;   // str, int, float, numeric, datetime
        std::vector<FieldValue> values;
    };

    using Criteria = std::map<std::string, CriterionSpec>;
    using RangePair = std::pair<FieldValue, FieldValue>;

    // Parse the {"field": {"type": ..., "data_type": ..., "value": [...]}} form.
    // Throws ConfigurationError for entries without type or value.
    Criteria criteria_from_json(const nlohmann::json& j);
    // false when the value fails the declared type; unknown types always pass
    bool check_type(const FieldValue& val, const std::optional<std::string>& declared_type);

    class FileFilter {
    public:
        explicit FileFilter(const Criteria& criteria = {}, unsigned threads = 1);
        ~FileFilter() {};

        // order preserving subsequence of file_list that passes every criterion
        std::vector<Record> filter_files(const std::vector<Record>& file_list) const;
        bool is_valid_file(const Record& file_info) const;
        // debug dump of the parsed criteria
        void show_criteria() const;

        const std::map<std::string, std::vector<FieldValue>>& list_criteria() const { return list_criteria_; }
        const std::map<std::string, std::vector<RangePair>>& range_criteria() const { return range_criteria_; }

    private:
        void parse_criteria(const Criteria& criteria);
        void parse_list_criteria(const std::string& field_name, const std::vector<FieldValue>& values);
        void parse_range_criteria(const std::string& field_name, const std::vector<FieldValue>& values);
        bool check_file_in_list_criteria(const Record& file_info) const;
        bool check_file_in_range_criteria(const Record& file_info) const;
        std::optional<std::string> declared_type(const std::string& field_name) const;

    private:
        std::map<std::string, std::vector<FieldValue>> list_criteria_;
        std::map<std::string, std::vector<RangePair>> range_criteria_;
        std::map<std::string, std::optional<std::string>> type_map_;
        unsigned threads_;
    };
} // namespace seiscat
