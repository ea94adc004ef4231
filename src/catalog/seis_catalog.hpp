#pragma once
#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <optional>
#include <functional>
#include "field_registry.hpp"
#include "file_filter.hpp"
#include "organizer.hpp"
#include "record.hpp"

namespace seiscat {

    struct CatalogOptions {
        // added in order to a copy of the default registry
        std::vector<std::pair<std::string, std::string>> custom_fields;
        bool overwrite{false};
        PatternRules rules;
        bool derive_time{true};
    };

    // Instrument response files (RESP, StationXML, ...): no date fields, no time.
    CatalogOptions response_catalog_options();

    enum class CatalogState {
        INITIALIZED,
        MATCHED,
        FILTERED,
        GROUPED,
        ORGANIZED
    };

    std::string state_name(CatalogState state);

    // Sequences match -> filter -> group/organize over one array directory.
    // A stage called before its source stage ran, or without labels, logs and
    // returns false without touching any stored result.
    class SeisCatalog {
    public:
        // throws ConfigurationError for an invalid template or custom field
        SeisCatalog(std::string array_dir, std::string pattern, CatalogOptions options = CatalogOptions{});
        ~SeisCatalog() {};

        // rescans the directory, drops any previous filter/group/organize result
        const std::vector<Record>& match(unsigned threads = 1);
        // run fn over every matched record, e.g. to attach a file size; drops any
        // previous filter/group/organize result
        bool annotate(const std::function<void(Record&)>& fn);
        bool filter(const Criteria& criteria, unsigned threads = 1, bool verbose = false);
        bool group(const std::vector<std::string>& labels, const std::vector<std::string>& sort_labels = {},
                   bool filtered = true);
        bool organize(const std::vector<std::string>& label_order, const std::string& output_type = "dict",
                      bool filtered = true);

        std::vector<std::string> get_stations(bool filtered = true) const;
        std::vector<std::optional<Timestamp>> get_times(bool filtered = true) const;
        std::vector<std::optional<FieldValue>> get_field(const std::string& name, bool filtered = true) const;

        CatalogState state() const { return state_; }
        const std::string& array_dir() const { return array_dir_; }
        const std::string& pattern() const { return pattern_; }
        const std::string& regex_pattern() const { return compiled_->expression; }
        const FieldRegistry& registry() const { return registry_; }
        const std::optional<std::vector<Record>>& files() const { return files_; }
        const std::optional<std::vector<Record>>& filtered_files() const { return filtered_files_; }
        const std::optional<FileGroups>& files_group() const { return files_group_; }
        const std::optional<VirtualArray>& virtual_array() const { return virtual_array_; }

    private:
        // nullptr (after logging) when the requested stage has not run
        const std::vector<Record>* source(bool filtered) const;

    private:
        std::string array_dir_;
        std::string pattern_;
        CatalogOptions options_;
        FieldRegistry registry_;
        std::shared_ptr<const CompiledPattern> compiled_;
        CatalogState state_{CatalogState::INITIALIZED};

        std::optional<std::vector<Record>> files_;
        std::optional<std::vector<Record>> filtered_files_;
        std::optional<FileGroups> files_group_;
        std::optional<VirtualArray> virtual_array_;
    };
} // namespace seiscat
