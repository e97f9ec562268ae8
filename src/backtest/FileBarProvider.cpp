#include "backtest/FileBarProvider.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <system_error>

namespace tradelab {
namespace backtest {

FileBarProvider::FileBarProvider(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::optional<std::filesystem::path> FileBarProvider::resolve(const std::string& symbol,
                                                              const std::string& interval) const {
    std::vector<std::string> candidates;
    if (!interval.empty()) {
        candidates.push_back(symbol + "_" + interval + ".csv");
        candidates.push_back(symbol + "_" + interval + ".json");
    }
    candidates.push_back(symbol + ".csv");
    candidates.push_back(symbol + ".json");

    std::error_code ec;
    for (const auto& name : candidates) {
        const auto path = data_dir_ / name;
        if (std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<Bar>> FileBarProvider::fetch(const std::string& symbol,
                                                       const std::string& period,
                                                       const std::string& interval) {
    const auto path = resolve(symbol, interval);
    if (!path) {
        LOG_ERROR("No bar file for {} ({}) in {}", symbol, interval, data_dir_.string());
        return std::nullopt;
    }

    std::vector<Bar> bars = (path->extension() == ".json")
        ? DataHistory::loadJSON(path->string())
        : DataHistory::loadCSV(path->string());

    const auto filtered = DataHistory::filterByPeriod(bars, period);
    if (filtered.size() != bars.size()) {
        LOG_INFO("Period {} keeps {} of {} bars for {}", period, filtered.size(), bars.size(), symbol);
    }
    return filtered;
}

} // namespace backtest
} // namespace tradelab
