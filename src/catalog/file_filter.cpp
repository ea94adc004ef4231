#include "file_filter.hpp"
#include <cstdlib>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "src/util/parallel.hpp"
#include "src/util/util.hpp"

namespace seiscat {

    static std::string describe_values(const std::vector<FieldValue>& values) {
        std::ostringstream oss;
        oss << "[";
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i) oss << ", ";
            oss << format_value(values[i]);
        }
        oss << "]";
        return oss.str();
    }

    static FieldValue json_to_value(const std::string& field_name, const nlohmann::json& v,
                                    const std::optional<std::string>& data_type) {
        if (v.is_string()) {
            const std::string& s = v.get_ref<const std::string&>();
            if (data_type && *data_type == "datetime") {
                auto ts = util::parse_timestamp(s);
                if (!ts) {
                    spdlog::error("Field '{}' has an unparsable datetime value '{}'", field_name, s);
                    throw ConfigurationError("field '" + field_name + "' has an unparsable datetime value: " + s);
                }
                return *ts;
            }
            return s;
        }
        if (v.is_number_integer()) return v.get<std::int64_t>();
        if (v.is_number_float()) return v.get<double>();
        spdlog::error("Field '{}' has an unsupported value: {}", field_name, v.dump());
        throw ConfigurationError("field '" + field_name + "' has an unsupported value: " + v.dump());
    }

    Criteria criteria_from_json(const nlohmann::json& j) {
        Criteria criteria;
        if (j.is_null()) return criteria;
        if (!j.is_object()) {
            spdlog::error("Criteria must be a JSON object, got: {}", j.dump());
            throw ConfigurationError("criteria must be a JSON object");
        }
        for (const auto& [field_name, cfg] : j.items()) {
            // cfg should be like {"type": "list"/"range", "value": ...}
            if (!cfg.is_object() || !cfg.contains("type") || !cfg.contains("value")) {
                spdlog::error("Field '{}' is invalid. Must contain 'type' and 'value'.", field_name);
                throw ConfigurationError("criteria field '" + field_name + "' must contain 'type' and 'value'");
            }
            CriterionSpec spec;
            std::string filter_type = cfg["type"].is_string() ? cfg["type"].get<std::string>() : cfg["type"].dump();
            if (filter_type == "list") {
                spec.mode = CriterionMode::LIST;
            } else if (filter_type == "range") {
                spec.mode = CriterionMode::RANGE;
            } else {
                spdlog::error("Field '{}' has unknown filter type '{}'. Skipped.", field_name, filter_type);
                continue;
            }
            if (cfg.contains("data_type") && cfg["data_type"].is_string()) {
                spec.data_type = cfg["data_type"].get<std::string>();
            }
            const auto& values = cfg["value"];
            if (!values.is_array()) {
                spdlog::error("Field '{}' claims '{}' type but 'value' is not a list: {}", field_name, filter_type, values.dump());
                continue;
            }
            for (const auto& v : values) spec.values.push_back(json_to_value(field_name, v, spec.data_type));
            criteria[field_name] = std::move(spec);
        }
        return criteria;
    }

    bool check_type(const FieldValue& val, const std::optional<std::string>& declared_type) {
        if (!declared_type) return true;
        const std::string& t = *declared_type;
        if (t == "datetime") {
            return std::holds_alternative<Timestamp>(val);
        } else if (t == "float" || t == "int" || t == "numeric") {
            // as long as it can be cast to a float we consider it numeric
            if (is_numeric(val)) return true;
            const auto* s = std::get_if<std::string>(&val);
            if (!s) return false;
            std::size_t b = 0, e = s->size();
            while (b < e && std::isspace(static_cast<unsigned char>((*s)[b]))) ++b;
            while (e > b && std::isspace(static_cast<unsigned char>((*s)[e - 1]))) --e;
            if (b == e) return false;
            std::string trimmed = s->substr(b, e - b);
            // strtod reads hex floats, plain decimal only here
            std::size_t digits = (trimmed[0] == '+' || trimmed[0] == '-') ? 1 : 0;
            if (trimmed.size() > digits + 1 && trimmed[digits] == '0' &&
                (trimmed[digits + 1] == 'x' || trimmed[digits + 1] == 'X')) {
                return false;
            }
            char* end = nullptr;
            std::strtod(trimmed.c_str(), &end);
            return end == trimmed.c_str() + trimmed.size();
        } else if (t == "str") {
            return std::holds_alternative<std::string>(val);
        }
        // if no recognized declared_type, we just skip check
        return true;
    }

    FileFilter::FileFilter(const Criteria& criteria, unsigned threads) : threads_(threads) {
        parse_criteria(criteria);
    }

    void FileFilter::parse_criteria(const Criteria& criteria) {
        for (const auto& [field_name, spec] : criteria) {
            type_map_[field_name] = spec.data_type;
            if (spec.mode == CriterionMode::LIST) {
                parse_list_criteria(field_name, spec.values);
            } else {
                parse_range_criteria(field_name, spec.values);
            }
        }
    }

    void FileFilter::parse_list_criteria(const std::string& field_name, const std::vector<FieldValue>& values) {
        // stored verbatim, no coercion
        list_criteria_[field_name] = values;
    }

    void FileFilter::parse_range_criteria(const std::string& field_name, const std::vector<FieldValue>& values) {
        std::size_t usable = values.size();
        // if the number of values is odd, discard the last one
        if (usable % 2 != 0) {
            spdlog::warn("Field '{}' has an odd number of range items, discarding the last one.", field_name);
            --usable;
        }
        std::vector<RangePair> range_pairs;
        for (std::size_t i = 0; i < usable; i += 2) {
            range_pairs.emplace_back(values[i], values[i + 1]);
        }
        if (!range_pairs.empty()) range_criteria_[field_name] = std::move(range_pairs);
    }

    std::optional<std::string> FileFilter::declared_type(const std::string& field_name) const {
        auto it = type_map_.find(field_name);
        if (it == type_map_.end()) return std::nullopt;
        return it->second;
    }

    bool FileFilter::check_file_in_list_criteria(const Record& file_info) const {
        for (const auto& [field_name, valid_list] : list_criteria_) {
            auto file_value = file_info.get(field_name);
            if (!file_value) return false;

            // 1) optional type check
            auto type = declared_type(field_name);
            if (!check_type(*file_value, type)) {
                spdlog::warn("Field '{}' has an invalid type '{}', expected '{}'.", field_name,
                             value_type_name(*file_value), *type);
                return false;
            }

            // 2) check membership
            bool found = false;
            for (const auto& v : valid_list) {
                if (values_equal(*file_value, v)) {
                    found = true;
                    break;
                }
            }
            if (!found) return false;
        }
        return true;
    }

    bool FileFilter::check_file_in_range_criteria(const Record& file_info) const {
        for (const auto& [field_name, pairs] : range_criteria_) {
            auto file_value = file_info.get(field_name);
            if (!file_value) return false;

            auto type = declared_type(field_name);
            if (!check_type(*file_value, type)) {
                spdlog::warn("Field '{}' has an invalid type '{}', expected '{}'.", field_name,
                             value_type_name(*file_value), *type);
                return false;
            }

            bool in_any_range = false;
            for (const auto& [start, end] : pairs) {
                auto lo = compare_values(start, *file_value);
                auto hi = compare_values(*file_value, end);
                if (!lo || !hi) {
                    spdlog::warn("Field '{}' value '{}' cannot be compared with range [{}, {}]", field_name,
                                 format_value(*file_value), format_value(start), format_value(end));
                    continue;
                }
                if (*lo <= 0 && *hi <= 0) {
                    in_any_range = true;
                    break;
                }
            }
            if (!in_any_range) return false;
        }
        return true;
    }

    bool FileFilter::is_valid_file(const Record& file_info) const {
        if (!check_file_in_list_criteria(file_info)) return false;
        if (!check_file_in_range_criteria(file_info)) return false;
        return true;
    }

    std::vector<Record> FileFilter::filter_files(const std::vector<Record>& file_list) const {
        if (file_list.empty()) {
            spdlog::warn("No files provided for filtering.");
            return {};
        }

        spdlog::debug("filtering files...");
        // char, not bool, so workers write distinct bytes
        auto results = parallel_map(file_list, threads_, [this](const Record& r) -> char {
            return is_valid_file(r) ? 1 : 0;
        });

        std::vector<Record> filtered_files;
        for (std::size_t i = 0; i < file_list.size(); ++i) {
            if (results[i]) filtered_files.push_back(file_list[i]);
        }
        spdlog::info("filtering finished, {} files passed.", filtered_files.size());
        return filtered_files;
    }

    void FileFilter::show_criteria() const {
        spdlog::debug("===== Filter Criteria Summary =====");
        spdlog::debug("List Criteria:");
        for (const auto& [field_name, values] : list_criteria_) {
            spdlog::debug("  - Field '{}' [Type: {}] => {}", field_name,
                          declared_type(field_name).value_or("N/A"), describe_values(values));
        }
        spdlog::debug("Range Criteria:");
        for (const auto& [field_name, pairs] : range_criteria_) {
            std::ostringstream oss;
            for (const auto& [start, end] : pairs) {
                oss << "(" << format_value(start) << ", " << format_value(end) << ") ";
            }
            spdlog::debug("  - Field '{}' [Type: {}] => {}", field_name,
                          declared_type(field_name).value_or("N/A"), oss.str());
        }
        spdlog::debug("Type Map (field: declared_type):");
        for (const auto& [field_name, type] : type_map_) {
            spdlog::debug("  - {}: {}", field_name, type.value_or("None"));
        }
    }
} // namespace seiscat
