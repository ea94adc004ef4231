#include "catalog_config.hpp"
#include <fstream>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace seiscat {
    namespace fs = std::filesystem;

    nlohmann::json load_config(const std::string& config_path) {
        nlohmann::json j;
        std::ifstream ifs(config_path);
        if (!ifs.is_open()) {
            spdlog::error("Failed to open config file: {}", config_path);
            return {};
        }
        try {
            ifs >> j;
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::error("Failed to parse config JSON {}: {}", config_path, e.what());
            return {};
        }
        if (!j.is_object()) {
            spdlog::error("Config {} must hold a JSON object", config_path);
            return {};
        }
        return j;
    }

    static std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
        std::vector<std::string> out;
        if (j.contains(key) && j[key].is_array()) {
            for (const auto& v : j[key]) out.push_back(v.get<std::string>());
        }
        return out;
    }

    static std::optional<bool> optional_bool(const nlohmann::json& j, const char* key) {
        if (!j.contains(key)) return std::nullopt;
        return j[key].get<bool>();
    }

    static CatalogOptions catalog_options(const nlohmann::json& c) {
        CatalogOptions options;
        std::string profile = c.value("profile", std::string("waveform"));
        if (profile == "response") {
            options = response_catalog_options();
        } else if (profile != "waveform") {
            spdlog::error("Unknown catalog profile '{}'", profile);
            throw ConfigurationError("unknown catalog profile: " + profile);
        }
        options.overwrite = c.value("overwrite", false);
        if (c.contains("custom_fields") && c["custom_fields"].is_object()) {
            for (const auto& [name, regex_str] : c["custom_fields"].items()) {
                options.custom_fields.emplace_back(name, regex_str.get<std::string>());
            }
        }
        return options;
    }

    CatalogConfig parse_catalog_config(const nlohmann::json& cfg) {
        if (!cfg.is_object() || !cfg.contains("catalog") || !cfg["catalog"].is_object()) {
            spdlog::error("Config has no catalog section");
            throw ConfigurationError("config must contain a catalog object");
        }
        const auto& c = cfg["catalog"];
        if (!c.contains("home") || !c.contains("pattern")) {
            spdlog::error("catalog.home and catalog.pattern are required");
            throw ConfigurationError("catalog.home and catalog.pattern are required");
        }

        CatalogConfig config;
        config.home = c["home"].get<std::string>();
        config.pattern = c["pattern"].get<std::string>();
        config.threads = c.value("threads", 1u);
        config.options = catalog_options(c);

        config.attach = string_list(cfg, "attach");
        for (const auto& field : config.attach) {
            if (field != "size") {
                spdlog::error("Unknown attach field '{}'", field);
                throw ConfigurationError("unknown attach field: " + field);
            }
        }

        if (cfg.contains("criteria")) config.criteria = criteria_from_json(cfg["criteria"]);
        config.verbose = cfg.value("verbose", false);

        if (cfg.contains("group")) {
            const auto& g = cfg["group"];
            config.group = GroupConfig{string_list(g, "labels"), string_list(g, "sort_labels"),
                                       optional_bool(g, "filtered")};
        }
        if (cfg.contains("organize")) {
            const auto& o = cfg["organize"];
            config.organize = OrganizeConfig{string_list(o, "label_order"),
                                             o.value("output", std::string("dict")),
                                             optional_bool(o, "filtered")};
        }
        return config;
    }

    static void attach_file_size(Record& r) {
        std::error_code ec;
        auto size = fs::file_size(r.path, ec);
        if (ec) {
            spdlog::warn("Cannot read size of {}: {}", r.path, ec.message());
            return;
        }
        r.set("size", static_cast<std::int64_t>(size));
    }

    nlohmann::json run_catalog(const CatalogConfig& config) {
        SeisCatalog catalog(config.home, config.pattern, config.options);
        catalog.match(config.threads);

        for (const auto& field : config.attach) {
            if (field == "size") catalog.annotate(attach_file_size);
        }

        nlohmann::json out;
        out["regex"] = catalog.regex_pattern();
        out["files"] = records_to_json(*catalog.files());

        if (config.criteria && catalog.filter(*config.criteria, config.threads, config.verbose)) {
            out["filtered_files"] = records_to_json(*catalog.filtered_files());
        }

        bool have_filtered = catalog.filtered_files().has_value();
        if (config.group) {
            const auto& g = *config.group;
            if (catalog.group(g.labels, g.sort_labels, g.filtered.value_or(have_filtered))) {
                out["groups"] = groups_to_json(*catalog.files_group());
            }
        }
        if (config.organize) {
            const auto& o = *config.organize;
            if (catalog.organize(o.label_order, o.output, o.filtered.value_or(have_filtered))) {
                out["virtual_array"] = catalog.virtual_array()->to_json();
            }
        }
        return out;
    }

    nlohmann::json run_catalog(const nlohmann::json& cfg) {
        return run_catalog(parse_catalog_config(cfg));
    }

    int run_catalog_cli(const nlohmann::json& cfg, std::ostream& out) {
        if (cfg.is_null() || cfg.empty()) {
            spdlog::error("Invalid or empty config");
            return 1;
        }
        try {
            out << run_catalog(cfg).dump(2) << std::endl;
        } catch (const ConfigurationError& e) {
            spdlog::error("Configuration error: {}", e.what());
            return 2;
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("JSON error in config: {}", e.what());
            return 2;
        }
        return 0;
    }
} // namespace seiscat
