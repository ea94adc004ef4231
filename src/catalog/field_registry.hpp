#pragma once
#include <string>
#include <vector>
#include <optional>
#include <boost/regex.hpp>
#include "errors.hpp"

namespace seiscat {

    struct FieldDefinition {
        std::string name;       // token used in templates, e.g. "YYYY"
        std::string group;      // capture group name it extracts into, e.g. "year"
        std::string pattern;    // full named group, e.g. (?<year>\d{4})
    };

    // A template token found by scanning: a field reference, a wildcard or literal text.
    struct PatternToken {
        enum Kind { LITERAL, FIELD, ANY_SEGMENT, ANY };
        Kind kind;
        std::string text;
    };

    struct CompiledPattern {
        std::string expression;             // anchored regex source
        std::vector<std::string> groups;    // capture groups in template order
        boost::regex regex;
    };

    // Tokens that every template of a catalog must carry, and whether a
    // complete date-field set is demanded.
    struct PatternRules {
        std::vector<std::string> required_fields{"home", "station", "component"};
        bool require_date_fields{true};
    };

    class FieldRegistry {
    public:
        FieldRegistry() = default;
        explicit FieldRegistry(std::vector<FieldDefinition> base_fields);

        // stores (?<name>regex_str); existing names are kept unless overwrite is set
        void add_field(const std::string& field_name, const std::string& regex_str, bool overwrite = false);
        void remove_field(const std::string& field_name);
        bool contains(const std::string& field_name) const;
        const FieldDefinition* find(const std::string& field_name) const;
        const std::vector<FieldDefinition>& get_fields() const { return fields_; }

        // throws ConfigurationError listing every unregistered {name} token
        void validate_pattern_fields(const std::string& pattern) const;

        // Substitute field tokens, escape literal text and expand wildcards.
        // When home is given, {home} becomes that literal path instead of its group.
        std::string build_regex_pattern(const std::string& pattern,
                                        const std::optional<std::string>& home = std::nullopt) const;
        CompiledPattern compile(const std::string& pattern,
                                const std::optional<std::string>& home = std::nullopt) const;

    private:
        std::string render(const std::vector<PatternToken>& tokens,
                           const std::optional<std::string>& home,
                           std::vector<std::string>* groups) const;

    private:
        std::vector<FieldDefinition> fields_;   // ordered, names unique
    };

    // split a template into literal runs, {name} references and {?}/{*} wildcards
    std::vector<PatternToken> tokenize_pattern(const std::string& pattern);
    // names of all {name} references in template order, duplicates kept
    std::vector<std::string> pattern_field_names(const std::string& pattern);
    std::string escape_literal(const std::string& text);

    std::vector<FieldDefinition> default_base_fields();

    // Validate a template for a catalog rooted at array_dir and return the
    // anchored expression with {home} bound to the normalized root.
    CompiledPattern check_pattern(const std::string& array_dir, const std::string& pattern,
                                  const FieldRegistry& registry, const PatternRules& rules = PatternRules{});
} // namespace seiscat
