#include "seis_catalog.hpp"
#include <spdlog/spdlog.h>
#include "file_matcher.hpp"
#include "src/util/util.hpp"

namespace seiscat {

    CatalogOptions response_catalog_options() {
        CatalogOptions options;
        options.custom_fields = {
            {"resptype", "RESP|StationXML|PAZ|FAP"},
            {"version", R"(v\d{2})"},
        };
        options.rules.required_fields = {"home", "station", "component", "resptype"};
        options.rules.require_date_fields = false;
        options.derive_time = false;
        return options;
    }

    std::string state_name(CatalogState state) {
        switch (state) {
            case CatalogState::INITIALIZED: return "initialized";
            case CatalogState::MATCHED: return "matched";
            case CatalogState::FILTERED: return "filtered";
            case CatalogState::GROUPED: return "grouped";
            case CatalogState::ORGANIZED: return "organized";
        }
        return "unknown";
    }

    SeisCatalog::SeisCatalog(std::string array_dir, std::string pattern, CatalogOptions options)
        : array_dir_(std::move(array_dir)), pattern_(std::move(pattern)), options_(std::move(options)),
          registry_(default_base_fields()) {
        // add custom fields to the registry
        for (const auto& [field_name, regex_str] : options_.custom_fields) {
            registry_.add_field(field_name, regex_str, options_.overwrite);
        }
        compiled_ = std::make_shared<const CompiledPattern>(
            check_pattern(array_dir_, pattern_, registry_, options_.rules));
        spdlog::info("Catalog for {} with pattern {} ready", array_dir_, pattern_);
    }

    const std::vector<Record>& SeisCatalog::match(unsigned threads) {
        FileMatcher matcher(util::normalize_path(array_dir_), compiled_, options_.derive_time);
        files_ = matcher.match_files(threads);
        filtered_files_.reset();
        files_group_.reset();
        virtual_array_.reset();
        state_ = CatalogState::MATCHED;
        return *files_;
    }

    bool SeisCatalog::annotate(const std::function<void(Record&)>& fn) {
        if (!files_) {
            spdlog::warn("Please match the files first.");
            return false;
        }
        for (auto& r : *files_) fn(r);
        // later stages were computed without the new fields
        filtered_files_.reset();
        files_group_.reset();
        virtual_array_.reset();
        state_ = CatalogState::MATCHED;
        return true;
    }

    bool SeisCatalog::filter(const Criteria& criteria, unsigned threads, bool verbose) {
        if (!files_) {
            spdlog::warn("Please match the files first.");
            return false;
        }
        FileFilter file_filter(criteria, threads);
        if (verbose) file_filter.show_criteria();
        filtered_files_ = file_filter.filter_files(*files_);
        state_ = CatalogState::FILTERED;
        return true;
    }

    const std::vector<Record>* SeisCatalog::source(bool filtered) const {
        const auto& files = filtered ? filtered_files_ : files_;
        if (!files) {
            if (filtered) spdlog::error("Please filter the files first.");
            else spdlog::error("Please match the files first.");
            return nullptr;
        }
        return &*files;
    }

    bool SeisCatalog::group(const std::vector<std::string>& labels, const std::vector<std::string>& sort_labels,
                            bool filtered) {
        if (labels.empty()) {
            spdlog::error("Grouping needs at least one label");
            return false;
        }
        const auto* files = source(filtered);
        if (!files) return false;
        files_group_ = group_by_labels(*files, labels, sort_labels);
        state_ = CatalogState::GROUPED;
        return true;
    }

    bool SeisCatalog::organize(const std::vector<std::string>& label_order, const std::string& output_type,
                               bool filtered) {
        if (label_order.empty()) {
            spdlog::error("Organizing needs at least one label");
            return false;
        }
        const auto* files = source(filtered);
        if (!files) return false;
        virtual_array_ = organize_by_labels(*files, label_order, parse_output_type(output_type));
        state_ = CatalogState::ORGANIZED;
        return true;
    }

    std::vector<std::optional<FieldValue>> SeisCatalog::get_field(const std::string& name, bool filtered) const {
        std::vector<std::optional<FieldValue>> values;
        const auto* files = source(filtered);
        if (!files) return values;
        values.reserve(files->size());
        for (const auto& r : *files) values.push_back(r.get(name));
        return values;
    }

    std::vector<std::string> SeisCatalog::get_stations(bool filtered) const {
        std::vector<std::string> station_set;
        for (const auto& v : get_field("station", filtered)) {
            station_set.push_back(v ? format_value(*v) : std::string());
        }
        return station_set;
    }

    std::vector<std::optional<Timestamp>> SeisCatalog::get_times(bool filtered) const {
        std::vector<std::optional<Timestamp>> time_set;
        const auto* files = source(filtered);
        if (!files) return time_set;
        time_set.reserve(files->size());
        for (const auto& r : *files) time_set.push_back(r.time);
        return time_set;
    }
} // namespace seiscat
