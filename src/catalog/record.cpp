#include "record.hpp"
#include <sstream>

namespace seiscat {

    std::optional<FieldValue> Record::get(std::string_view name) const {
        if (name == "path") return FieldValue(path);
        if (name == "time") {
            if (!time) return std::nullopt;
            return FieldValue(*time);
        }
        auto it = fields.find(std::string(name));
        if (it == fields.end()) return std::nullopt;
        return it->second;
    }

    void Record::set(const std::string& name, FieldValue value) {
        if (name == "path") {
            if (auto* s = std::get_if<std::string>(&value)) path = *s;
            return;
        }
        if (name == "time") {
            if (auto* t = std::get_if<Timestamp>(&value)) time = *t;
            return;
        }
        fields[name] = std::move(value);
    }

    bool is_numeric(const FieldValue& v) {
        return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<double>(v);
    }

    static double as_double(const FieldValue& v) {
        if (auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
        return std::get<double>(v);
    }

    template <typename T>
    static int three_way(const T& a, const T& b) {
        if (a < b) return -1;
        if (b < a) return 1;
        return 0;
    }

    std::optional<int> compare_values(const FieldValue& a, const FieldValue& b) {
        if (std::holds_alternative<std::int64_t>(a) && std::holds_alternative<std::int64_t>(b)) {
            return three_way(std::get<std::int64_t>(a), std::get<std::int64_t>(b));
        }
        if (is_numeric(a) && is_numeric(b)) {
            double x = as_double(a);
            double y = as_double(b);
            // NaN has no order
            if (!(x < y) && !(y < x) && !(x == y)) return std::nullopt;
            return three_way(x, y);
        }
        if (a.index() != b.index()) return std::nullopt;
        if (auto* s = std::get_if<std::string>(&a)) return three_way(*s, std::get<std::string>(b));
        return three_way(std::get<Timestamp>(a), std::get<Timestamp>(b));
    }

    bool values_equal(const FieldValue& a, const FieldValue& b) {
        auto c = compare_values(a, b);
        return c.has_value() && *c == 0;
    }

    bool value_less(const FieldValue& a, const FieldValue& b) {
        auto c = compare_values(a, b);
        if (c) return *c < 0;
        // numbers share one rank so int/double mixes sort together
        auto rank = [](const FieldValue& v) -> int {
            if (is_numeric(v)) return 1;
            return static_cast<int>(v.index());
        };
        if (rank(a) != rank(b)) return rank(a) < rank(b);
        return false;
    }

    std::string format_value(const FieldValue& v) {
        if (auto* s = std::get_if<std::string>(&v)) return *s;
        if (auto* i = std::get_if<std::int64_t>(&v)) return std::to_string(*i);
        if (auto* d = std::get_if<double>(&v)) {
            std::ostringstream oss;
            oss << *d;
            return oss.str();
        }
        return util::format_timestamp(std::get<Timestamp>(v));
    }

    std::string value_type_name(const FieldValue& v) {
        switch (v.index()) {
            case 0: return "str";
            case 1: return "int";
            case 2: return "float";
            default: return "datetime";
        }
    }

    nlohmann::json value_to_json(const FieldValue& v) {
        if (auto* s = std::get_if<std::string>(&v)) return *s;
        if (auto* i = std::get_if<std::int64_t>(&v)) return *i;
        if (auto* d = std::get_if<double>(&v)) return *d;
        return util::format_timestamp(std::get<Timestamp>(v));
    }

    nlohmann::json record_to_json(const Record& r) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [name, value] : r.fields) j[name] = value_to_json(value);
        j["path"] = r.path;
        if (r.time) j["time"] = util::format_timestamp(*r.time);
        else j["time"] = nullptr;
        return j;
    }

    nlohmann::json records_to_json(const std::vector<Record>& records) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& r : records) j.push_back(record_to_json(r));
        return j;
    }
} // namespace seiscat
