#pragma once
#include <string>
#include <vector>
#include <ostream>
#include <optional>
#include <nlohmann/json.hpp>
#include "seis_catalog.hpp"

namespace seiscat {

    struct GroupConfig {
        std::vector<std::string> labels;
        std::vector<std::string> sort_labels;
        std::optional<bool> filtered;   // unset: filtered when a filter ran
    };

    struct OrganizeConfig {
        std::vector<std::string> label_order;
        std::string output{"dict"};
        std::optional<bool> filtered;
    };

    // One catalog run as described by a config file.
    struct CatalogConfig {
        std::string home;
        std::string pattern;
        unsigned threads{1};
        CatalogOptions options;
        std::vector<std::string> attach;
        std::optional<Criteria> criteria;
        bool verbose{false};
        std::optional<GroupConfig> group;
        std::optional<OrganizeConfig> organize;
    };

    // Load JSON config from file. On error (missing file, bad JSON, not an
    // object) logs and returns an empty json.
    nlohmann::json load_config(const std::string& config_path);

    // throws ConfigurationError when catalog.home/catalog.pattern are missing,
    // the profile is unknown or an attach field is not supported
    CatalogConfig parse_catalog_config(const nlohmann::json& cfg);

    // match, annotate, filter, group and organize as configured and return
    // {regex, files, filtered_files?, groups?, virtual_array?}
    nlohmann::json run_catalog(const CatalogConfig& config);
    nlohmann::json run_catalog(const nlohmann::json& cfg);

    // CLI body: writes the result document to out and returns the exit code,
    // 1 for an empty config, 2 for configuration errors.
    int run_catalog_cli(const nlohmann::json& cfg, std::ostream& out);
} // namespace seiscat
