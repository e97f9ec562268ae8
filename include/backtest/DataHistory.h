#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace tradelab {
namespace backtest {

class DataHistory {
public:
    // Load bars from a CSV file.
    // With a header row, columns are matched by name (case-insensitive):
    //   timestamp|date|datetime, open, high, low, close, volume,
    //   rsi, macd, macd_signal, bb_upper, bb_lower, atr, volume_sma, sma_<N>.
    // Without one the positional layout timestamp,open,high,low,close,volume applies.
    // Empty or "nan" indicator cells stay unset. Result is sorted and de-duplicated.
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Load bars from a JSON array of objects using the same keys as the CSV header
    // (short o/h/l/c/v/t keys are accepted too).
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Keep the bars within `period` ("60d", "6mo", "1y", "1wk", "max") of the last bar.
    static std::vector<Bar> filterByPeriod(const std::vector<Bar>& bars, const std::string& period);

    // Seconds covered by a period string; nullopt for "max" or an unrecognised value.
    static std::optional<long long> periodToSeconds(const std::string& period);

    // Integer epoch, "YYYY-MM-DD" or "YYYY-MM-DD[ T]HH:MM[:SS]" (UTC) -> epoch value.
    static std::optional<BarTime> parseTimestamp(const std::string& text);

    // Sort ascending and drop repeated timestamps (first occurrence wins).
    static void normalize(std::vector<Bar>& bars);
};

} // namespace backtest
} // namespace tradelab
