#include "catalog_config.hpp"
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static void setup_logger(const nlohmann::json& cfg) {
    std::string log_path;
    std::string log_level = "info";
    if (cfg.contains("log")) {
        auto l = cfg["log"];
        if (l.contains("path")) log_path = l["path"].get<std::string>();
        if (l.contains("level")) log_level = l["level"].get<std::string>();
    }

    // stdout carries the catalog JSON, so console logging goes to stderr
    std::shared_ptr<spdlog::logger> logger;
    if (!log_path.empty()) {
        logger = spdlog::daily_logger_mt("daily_logger", log_path.append("/seiscat.log"), 0, 0, false, 7);
    } else {
        logger = spdlog::stderr_color_mt("console");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (log_level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    logger->flush_on(spdlog::level::info);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        spdlog::error("Usage: seiscat <config.json>");
        return 1;
    }
    std::string config_path = argv[1];
    auto cfg = seiscat::load_config(config_path);
    if (cfg.is_null()) {
        spdlog::error("Invalid or empty config: {}", config_path);
        return 1;
    }

    try {
        setup_logger(cfg);
    } catch (const std::exception& e) {
        spdlog::error("Failed to set up logging from {}: {}", config_path, e.what());
        return 2;
    }
    return seiscat::run_catalog_cli(cfg, std::cout);
}
