#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tradelab {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    try {
        const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

        std::cout << "Config file: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: config file could not be opened." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        applyJson(j);

        std::cout << "Config loaded: data_dir=" << data_dir_
                  << ", strategies=" << strategies_file_ << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::applyJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }

    if (j.contains("data")) {
        const auto& d = j["data"];
        data_dir_ = d.value("dir", data_dir_);
        default_period_ = d.value("default_period", default_period_);
        default_interval_ = d.value("default_interval", default_interval_);
    }

    if (j.contains("strategies")) {
        strategies_file_ = j["strategies"].value("file", strategies_file_);
    }

    if (j.contains("statistics")) {
        const auto& s = j["statistics"];
        statistics_options_.risk_free_rate = s.value("risk_free_rate", statistics_options_.risk_free_rate);
        statistics_options_.periods_per_year = s.value("periods_per_year", statistics_options_.periods_per_year);
        if (statistics_options_.periods_per_year <= 0.0) {
            std::cout << "Warning: statistics.periods_per_year must be positive, using 252" << std::endl;
            statistics_options_.periods_per_year = 252.0;
        }
    }

    if (j.contains("report")) {
        report_output_dir_ = j["report"].value("output_dir", report_output_dir_);
    }

    if (j.contains("batch")) {
        batch_max_parallel_ = std::max(1, j["batch"].value("max_parallel", batch_max_parallel_));
    }
}

} // namespace tradelab
