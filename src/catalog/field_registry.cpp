#include "field_registry.hpp"
#include <map>
#include <set>
#include <sstream>
#include <cctype>
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>
#include "src/util/util.hpp"

namespace seiscat {
    namespace fs = std::filesystem;

    #define ANY_SEGMENT_REGEX "[^. _/]*"
    #define ANY_REGEX ".*"

    static bool is_field_name(const std::string& s) {
        if (s.empty()) return false;
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
    }

    static std::string join(const std::vector<std::string>& items, const std::string& sep,
                            const std::string& prefix = "", const std::string& suffix = "") {
        std::ostringstream oss;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) oss << sep;
            oss << prefix << items[i] << suffix;
        }
        return oss.str();
    }

    static std::string named_group(const std::string& group, const std::string& regex_str) {
        return "(?<" + group + ">" + regex_str + ")";
    }

    std::vector<FieldDefinition> default_base_fields() {
        // token, capture group, fragment
        static const std::vector<std::vector<std::string>> table = {
            {"YYYY", "year", R"(\d{4})"},
            {"YY", "year", R"(\d{2})"},
            {"MM", "month", R"(\d{2})"},
            {"DD", "day", R"(\d{2})"},
            {"JJJ", "jday", R"(\d{3})"},
            {"HH", "hour", R"(\d{2})"},
            {"MI", "minute", R"(\d{2})"},
            {"home", "home", R"(\w+)"},
            {"network", "network", R"(\w+)"},
            {"event", "event", R"(\w+)"},
            {"station", "station", R"(\w+)"},
            {"component", "component", R"(\w+)"},
            {"sampleF", "sampleF", R"(\w+)"},
            {"quality", "quality", R"(\w+)"},
            {"locid", "locid", R"(\w+)"},
            {"suffix", "suffix", R"(\w+)"},
            {"label0", "label0", R"(\w+)"},
            {"label1", "label1", R"(\w+)"},
            {"label2", "label2", R"(\w+)"},
            {"label3", "label3", R"(\w+)"},
            {"label4", "label4", R"(\w+)"},
            {"label5", "label5", R"(\w+)"},
            {"label6", "label6", R"(\w+)"},
            {"label7", "label7", R"(\w+)"},
            {"label8", "label8", R"(\w+)"},
            {"label9", "label9", R"(\w+)"},
        };
        std::vector<FieldDefinition> fields;
        fields.reserve(table.size());
        for (const auto& row : table) {
            fields.push_back(FieldDefinition{row[0], row[1], named_group(row[1], row[2])});
        }
        return fields;
    }

    FieldRegistry::FieldRegistry(std::vector<FieldDefinition> base_fields) {
        for (auto& f : base_fields) {
            if (contains(f.name)) {
                spdlog::warn("Duplicate base field {} ignored", f.name);
                continue;
            }
            fields_.push_back(std::move(f));
        }
    }

    const FieldDefinition* FieldRegistry::find(const std::string& field_name) const {
        for (const auto& f : fields_) {
            if (f.name == field_name) return &f;
        }
        return nullptr;
    }

    bool FieldRegistry::contains(const std::string& field_name) const {
        return find(field_name) != nullptr;
    }

    void FieldRegistry::add_field(const std::string& field_name, const std::string& regex_str, bool overwrite) {
        if (contains(field_name) && !overwrite) {
            spdlog::warn("Field {} already exists! Use overwrite=true to overwrite.", field_name);
            return;
        }
        if (!is_field_name(field_name)) {
            spdlog::error("Invalid field name '{}'", field_name);
            throw ConfigurationError("invalid field name: " + field_name);
        }

        std::string group = named_group(field_name, regex_str);
        // test the regex
        try {
            boost::regex test(group);
        } catch (const boost::regex_error& e) {
            spdlog::error("Invalid regex pattern for field {}: {}", field_name, e.what());
            throw ConfigurationError("invalid regex pattern for field " + field_name + ": " + e.what());
        }

        for (auto& f : fields_) {
            if (f.name == field_name) {
                // keep the position, substitution order is part of the registry
                f.group = field_name;
                f.pattern = std::move(group);
                return;
            }
        }
        fields_.push_back(FieldDefinition{field_name, field_name, std::move(group)});
    }

    void FieldRegistry::remove_field(const std::string& field_name) {
        auto it = std::find_if(fields_.begin(), fields_.end(),
                               [&](const FieldDefinition& f) { return f.name == field_name; });
        if (it == fields_.end()) {
            spdlog::warn("Field {} not found.", field_name);
            return;
        }
        fields_.erase(it);
    }

    std::vector<PatternToken> tokenize_pattern(const std::string& pattern) {
        std::vector<PatternToken> tokens;
        std::string literal;
        auto flush_literal = [&]() {
            if (literal.empty()) return;
            tokens.push_back(PatternToken{PatternToken::LITERAL, std::move(literal)});
            literal.clear();
        };

        std::size_t i = 0;
        while (i < pattern.size()) {
            if (pattern[i] == '{') {
                std::size_t close = pattern.find('}', i + 1);
                if (close != std::string::npos) {
                    std::string inner = pattern.substr(i + 1, close - i - 1);
                    if (inner == "?" || inner == "*" || is_field_name(inner)) {
                        flush_literal();
                        if (inner == "?") tokens.push_back(PatternToken{PatternToken::ANY_SEGMENT, inner});
                        else if (inner == "*") tokens.push_back(PatternToken{PatternToken::ANY, inner});
                        else tokens.push_back(PatternToken{PatternToken::FIELD, inner});
                        i = close + 1;
                        continue;
                    }
                }
            }
            literal.push_back(pattern[i]);
            ++i;
        }
        flush_literal();
        return tokens;
    }

    std::vector<std::string> pattern_field_names(const std::string& pattern) {
        std::vector<std::string> names;
        for (const auto& t : tokenize_pattern(pattern)) {
            if (t.kind == PatternToken::FIELD) names.push_back(t.text);
        }
        return names;
    }

    std::string escape_literal(const std::string& text) {
        static const std::string special = R"(.^$|()[]{}*+?\)";
        std::string out;
        out.reserve(text.size() * 2);
        for (char c : text) {
            if (special.find(c) != std::string::npos) out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }

    void FieldRegistry::validate_pattern_fields(const std::string& pattern) const {
        std::vector<std::string> invalid;
        for (const auto& name : pattern_field_names(pattern)) {
            if (contains(name)) continue;
            if (std::find(invalid.begin(), invalid.end(), name) == invalid.end()) invalid.push_back(name);
        }
        if (!invalid.empty()) {
            std::string listed = join(invalid, ", ", "{", "}");
            spdlog::error("Pattern contains invalid fields: {}", listed);
            throw ConfigurationError("pattern contains invalid fields: " + listed);
        }
    }

    std::string FieldRegistry::render(const std::vector<PatternToken>& tokens,
                                      const std::optional<std::string>& home,
                                      std::vector<std::string>* groups) const {
        std::string out = "^";
        for (const auto& t : tokens) {
            switch (t.kind) {
                case PatternToken::LITERAL:
                    out += escape_literal(t.text);
                    break;
                case PatternToken::ANY_SEGMENT:
                    out += ANY_SEGMENT_REGEX;
                    break;
                case PatternToken::ANY:
                    out += ANY_REGEX;
                    break;
                case PatternToken::FIELD: {
                    if (t.text == "home" && home) {
                        out += escape_literal(*home);
                        break;
                    }
                    const FieldDefinition* def = find(t.text);
                    if (!def) throw ConfigurationError("pattern contains invalid fields: {" + t.text + "}");
                    out += def->pattern;
                    if (groups) groups->push_back(def->group);
                    break;
                }
            }
        }
        out += "$";
        return out;
    }

    std::string FieldRegistry::build_regex_pattern(const std::string& pattern,
                                                   const std::optional<std::string>& home) const {
        return render(tokenize_pattern(pattern), home, nullptr);
    }

    CompiledPattern FieldRegistry::compile(const std::string& pattern,
                                           const std::optional<std::string>& home) const {
        CompiledPattern compiled;
        compiled.expression = render(tokenize_pattern(pattern), home, &compiled.groups);

        std::set<std::string> seen;
        for (const auto& g : compiled.groups) {
            if (!seen.insert(g).second) {
                spdlog::error("Pattern binds capture group '{}' more than once: {}", g, pattern);
                throw ConfigurationError("pattern binds capture group '" + g + "' more than once");
            }
        }

        try {
            compiled.regex = boost::regex(compiled.expression);
        } catch (const boost::regex_error& e) {
            spdlog::error("Failed to compile pattern '{}' as '{}': {}", pattern, compiled.expression, e.what());
            throw ConfigurationError("failed to compile pattern: " + std::string(e.what()));
        }
        return compiled;
    }

    CompiledPattern check_pattern(const std::string& array_dir, const std::string& pattern,
                                  const FieldRegistry& registry, const PatternRules& rules) {
        if (pattern.empty()) {
            spdlog::error("Pattern must be a non-empty string");
            throw ConfigurationError("pattern must be a non-empty string");
        }

        // check if all fields in the pattern are valid
        registry.validate_pattern_fields(pattern);

        // avoid duplicate fields
        std::vector<std::string> names = pattern_field_names(pattern);
        std::map<std::string, int> field_counts;
        for (const auto& n : names) field_counts[n]++;
        std::vector<std::string> duplicates;
        for (const auto& n : names) {
            if (field_counts[n] > 1 && std::find(duplicates.begin(), duplicates.end(), n) == duplicates.end()) {
                duplicates.push_back(n);
            }
        }
        if (!duplicates.empty()) {
            std::string listed = join(duplicates, ", ", "{", "}");
            spdlog::error("Pattern contains duplicate fields: {}", listed);
            throw ConfigurationError("pattern contains duplicate fields: " + listed);
        }

        // check if necessary fields are in the pattern
        std::vector<std::string> missing;
        for (const auto& f : rules.required_fields) {
            if (field_counts.find(f) == field_counts.end()) missing.push_back(f);
        }
        if (!missing.empty()) {
            std::string listed = join(missing, ", ", "{", "}");
            spdlog::error("Pattern must contain {}", listed);
            throw ConfigurationError("pattern must contain " + listed);
        }

        // at least one token of the date-field sets; an incomplete set only
        // leaves the derived time absent
        if (rules.require_date_fields) {
            static const std::vector<std::string> date_fields = {"YYYY", "YY", "MM", "DD", "JJJ"};
            bool found = std::any_of(date_fields.begin(), date_fields.end(),
                                     [&](const std::string& f) { return field_counts.count(f) > 0; });
            if (!found) {
                spdlog::error("Pattern must contain one set of date fields: {}", pattern);
                throw ConfigurationError("pattern must contain one set of date fields "
                                         "({YYYY}{MM}{DD}, {YYYY}{JJJ}, {YY}{MM}{DD} or {YY}{JJJ})");
            }
        }

        std::error_code ec;
        if (!fs::is_directory(array_dir, ec)) {
            spdlog::error("{} is not a directory", array_dir);
        }

        std::string home = util::normalize_path(array_dir);
        // the template already carries the separator after {home}
        if (home == "/") home.clear();
        CompiledPattern compiled = registry.compile(pattern, home);
        spdlog::debug("Pattern '{}' compiled to '{}'", pattern, compiled.expression);
        return compiled;
    }
} // namespace seiscat
