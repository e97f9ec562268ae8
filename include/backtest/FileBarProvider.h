#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/contracts/IBarProvider.h"

namespace tradelab {
namespace backtest {

// Reads pre-annotated bar files from a data directory. For symbol AAPL and
// interval 1d it tries, in order:
//   AAPL_1d.csv, AAPL_1d.json, AAPL.csv, AAPL.json
// then trims the series to `period`.
class FileBarProvider : public core::IBarProvider {
public:
    explicit FileBarProvider(std::filesystem::path data_dir);

    std::optional<std::vector<Bar>> fetch(const std::string& symbol,
                                          const std::string& period,
                                          const std::string& interval) override;

    std::optional<std::filesystem::path> resolve(const std::string& symbol,
                                                 const std::string& interval) const;

private:
    std::filesystem::path data_dir_;
};

} // namespace backtest
} // namespace tradelab
