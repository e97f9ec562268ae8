#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <limits>
#include <stdexcept>
#include "common/Logger.h"

namespace tradelab {
namespace backtest {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<double> parseNumber(const std::string& cell) {
    const std::string lower = toLowerCopy(cell);
    if (lower.empty() || lower == "nan" || lower == "null" || lower == "none") {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        const double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// Howard Hinnant's days_from_civil.
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

// Canonical column name for a header/key, empty when not a bar field.
std::string canonicalField(const std::string& raw) {
    const std::string key = toLowerCopy(trim(raw));
    if (key == "timestamp" || key == "date" || key == "datetime" || key == "time" || key == "t") {
        return "timestamp";
    }
    if (key == "open" || key == "o") return "open";
    if (key == "high" || key == "h") return "high";
    if (key == "low" || key == "l") return "low";
    if (key == "close" || key == "c") return "close";
    if (key == "volume" || key == "v") return "volume";
    if (key == "rsi" || key == "macd" || key == "macd_signal" || key == "bb_upper" ||
        key == "bb_lower" || key == "atr" || key == "volume_sma") {
        return key;
    }
    if (key.size() > 4 && key.compare(0, 4, "sma_") == 0) {
        return key;
    }
    return "";
}

void assignField(Bar& bar, const std::string& field, std::optional<double> value) {
    if (field == "open") bar.open = value.value_or(NaN);
    else if (field == "high") bar.high = value.value_or(NaN);
    else if (field == "low") bar.low = value.value_or(NaN);
    else if (field == "close") bar.close = value.value_or(NaN);
    else if (field == "volume") bar.volume = value.value_or(0.0);
    else if (field == "rsi") bar.rsi = value;
    else if (field == "macd") bar.macd = value;
    else if (field == "macd_signal") bar.macd_signal = value;
    else if (field == "bb_upper") bar.bb_upper = value;
    else if (field == "bb_lower") bar.bb_lower = value;
    else if (field == "atr") bar.atr = value;
    else if (field == "volume_sma") bar.volume_sma = value;
    else if (field.compare(0, 4, "sma_") == 0 && value) {
        try {
            bar.sma[std::stoi(field.substr(4))] = *value;
        } catch (const std::exception&) {
            // Non-numeric suffix such as sma_fast: not a period column.
        }
    }
}

bool looksLikeDataRow(const std::string& first_cell) {
    return !first_cell.empty() &&
           (std::isdigit(static_cast<unsigned char>(first_cell[0])) || first_cell[0] == '-');
}

std::optional<BarTime> timestampFromDouble(double value) {
    // [-2^63, 2^63) is exactly the range that converts without overflow.
    constexpr double LIMIT = 9223372036854775808.0;
    if (!std::isfinite(value) || value >= LIMIT || value < -LIMIT) {
        return std::nullopt;
    }
    return static_cast<BarTime>(value);
}

std::optional<BarTime> timestampFromUnsigned(unsigned long long value) {
    if (value > static_cast<unsigned long long>(std::numeric_limits<BarTime>::max())) {
        return std::nullopt;
    }
    return static_cast<BarTime>(value);
}

Bar emptyBar() {
    Bar bar;
    bar.open = bar.high = bar.low = bar.close = NaN;
    return bar;
}
}

std::optional<BarTime> DataHistory::parseTimestamp(const std::string& text) {
    const std::string s = trim(text);
    if (s.empty()) {
        return std::nullopt;
    }

    const bool all_digits = std::all_of(s.begin() + (s[0] == '-' ? 1 : 0), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
    if (all_digits) {
        try {
            return std::stoll(s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    const int matched = std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d",
                                    &year, &month, &day, &sep, &hour, &minute, &second);
    if (matched < 3 || month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    if (matched >= 4 && sep != ' ' && sep != 'T') {
        return std::nullopt;
    }

    const long long days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * 86400LL + hour * 3600LL + minute * 60LL + second;
}

void DataHistory::normalize(std::vector<Bar>& bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });
    const auto before = bars.size();
    bars.erase(std::unique(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp == b.timestamp;
    }), bars.end());
    if (bars.size() != before) {
        LOG_WARN("Dropped {} bars with duplicate timestamps", before - bars.size());
    }
}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    // Positional layout unless a header says otherwise.
    std::vector<std::string> fields{"timestamp", "open", "high", "low", "close", "volume"};
    bool first_row = true;
    std::string line;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        if (first_row) {
            first_row = false;
            if (!looksLikeDataRow(row[0])) {
                fields.clear();
                for (const auto& header : row) {
                    fields.push_back(canonicalField(header));
                }
                if (std::find(fields.begin(), fields.end(), "close") == fields.end()) {
                    LOG_WARN("CSV header in {} has no close column", file_path);
                }
                continue;
            }
        }

        Bar bar = emptyBar();
        bool has_time = false;
        for (size_t c = 0; c < row.size() && c < fields.size(); ++c) {
            const std::string& field = fields[c];
            if (field.empty()) {
                continue;
            }
            if (field == "timestamp") {
                const auto ts = parseTimestamp(row[c]);
                if (ts) {
                    bar.timestamp = *ts;
                    has_time = true;
                }
                continue;
            }
            assignField(bar, field, parseNumber(row[c]));
        }

        if (!has_time) {
            LOG_WARN("Skipping row without a valid timestamp: {}", line);
            continue;
        }
        if (!bar.isUsable()) {
            LOG_WARN("Row at {} has invalid OHLC values; kept as unusable bar", bar.timestamp);
        }
        bars.push_back(std::move(bar));
    }

    normalize(bars);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    nlohmann::json j;
    try {
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("JSON bar file must hold an array: {}", file_path);
            return bars;
        }
        for (const auto& item : j) {
            if (!item.is_object()) {
                continue;
            }
            Bar bar = emptyBar();
            bool has_time = false;
            for (const auto& [key, value] : item.items()) {
                const std::string field = canonicalField(key);
                if (field.empty()) {
                    continue;
                }
                if (field == "timestamp") {
                    std::optional<BarTime> ts;
                    if (value.is_number_unsigned()) ts = timestampFromUnsigned(value.get<unsigned long long>());
                    else if (value.is_number_integer()) ts = value.get<long long>();
                    else if (value.is_number()) ts = timestampFromDouble(value.get<double>());
                    else if (value.is_string()) ts = parseTimestamp(value.get<std::string>());
                    if (ts) {
                        bar.timestamp = *ts;
                        has_time = true;
                    }
                    continue;
                }
                std::optional<double> number;
                if (value.is_number()) {
                    number = value.get<double>();
                }
                assignField(bar, field, number);
            }
            if (has_time) {
                bars.push_back(std::move(bar));
            }
        }
        normalize(bars);

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        bars.clear();
    }

    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::optional<long long> DataHistory::periodToSeconds(const std::string& period) {
    const std::string p = toLowerCopy(trim(period));
    if (p.empty() || p == "max") {
        return std::nullopt;
    }

    size_t digits = 0;
    while (digits < p.size() && std::isdigit(static_cast<unsigned char>(p[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return std::nullopt;
    }

    constexpr long long DAY = 86400;
    long long unit_seconds = 0;
    const std::string unit = p.substr(digits);
    if (unit == "d") unit_seconds = DAY;
    else if (unit == "wk" || unit == "w") unit_seconds = 7 * DAY;
    else if (unit == "mo") unit_seconds = 30 * DAY;
    else if (unit == "y") unit_seconds = 365 * DAY;
    else if (unit == "h") unit_seconds = 3600;
    else if (unit == "m") unit_seconds = 60;
    else return std::nullopt;

    long long count = 0;
    try {
        count = std::stoll(p.substr(0, digits));
    } catch (const std::out_of_range&) {
        LOG_WARN("Period '{}' is out of range, ignoring it", period);
        return std::nullopt;
    }
    if (count > std::numeric_limits<long long>::max() / unit_seconds) {
        LOG_WARN("Period '{}' is out of range, ignoring it", period);
        return std::nullopt;
    }
    return count * unit_seconds;
}

std::vector<Bar> DataHistory::filterByPeriod(const std::vector<Bar>& bars, const std::string& period) {
    const auto seconds = periodToSeconds(period);
    if (!seconds || bars.empty()) {
        return bars;
    }

    // Millisecond epochs are larger than any second epoch this side of year 5000.
    const BarTime last = bars.back().timestamp;
    const long long scale = (last > 100000000000LL || last < -100000000000LL) ? 1000 : 1;
    if (*seconds > std::numeric_limits<long long>::max() / scale ||
        last < std::numeric_limits<long long>::min() + *seconds * scale) {
        // Window reaches past the representable range: it covers every bar.
        return bars;
    }
    const BarTime cutoff = last - (*seconds * scale);

    std::vector<Bar> out;
    std::copy_if(bars.begin(), bars.end(), std::back_inserter(out),
                 [cutoff](const Bar& b) { return b.timestamp >= cutoff; });
    return out;
}

} // namespace backtest
} // namespace tradelab
