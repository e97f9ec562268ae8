#include "core/state/StrategyStoreJson.h"
#include "strategy/StrategyTemplates.h"
#include "common/Errors.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace tradelab;

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "tradelab_test_store";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const auto path = dir / "strategies.json";

    core::StrategyStoreJson store(path);

    if (!store.list().empty() || store.contains("macd_momentum")) {
        std::cerr << "[TEST] missing file should be an empty store\n";
        return 1;
    }

    bool thrown = false;
    try {
        store.load("macd_momentum");
    } catch (const StrategyNotFoundError& e) {
        thrown = (e.name() == "macd_momentum");
    }
    if (!thrown) {
        std::cerr << "[TEST] load on empty store should throw StrategyNotFoundError\n";
        return 1;
    }

    const int installed = strategy::StrategyTemplates::install(store);
    if (installed != 2) {
        std::cerr << "[TEST] expected 2 templates installed, got " << installed << "\n";
        return 1;
    }
    if (strategy::StrategyTemplates::install(store) != 0) {
        std::cerr << "[TEST] second install should skip existing entries\n";
        return 1;
    }
    if (strategy::StrategyTemplates::install(store, true) != 2) {
        std::cerr << "[TEST] overwrite install should rewrite both templates\n";
        return 1;
    }

    auto names = store.list();
    std::sort(names.begin(), names.end());
    if (names != std::vector<std::string>{"macd_momentum", "rsi_reversal"}) {
        std::cerr << "[TEST] unexpected strategy names\n";
        return 1;
    }

    // Installed templates keep their display names.
    if (store.load("macd_momentum").display_name != "MACD Momentum Strategy" ||
        store.load("rsi_reversal").display_name != "RSI Reversal Strategy") {
        std::cerr << "[TEST] template display names lost on install\n";
        return 1;
    }
    {
        std::ifstream in(path);
        nlohmann::json doc;
        in >> doc;
        if (doc["macd_momentum"].value("name", "") != "MACD Momentum Strategy") {
            std::cerr << "[TEST] stored entry should carry the display name\n";
            return 1;
        }
    }

    // Save a custom strategy and load it back through a second store instance.
    auto custom = strategy::StrategyTemplates::get("rsi_reversal");
    custom.name = "my_rsi";
    custom.initial_capital = 12345.0;
    custom.take_profit.type = strategy::TakeProfitType::LEVELS;
    custom.take_profit.levels_pct = {5.0, 7.5};
    if (!store.save("my_rsi", custom)) {
        std::cerr << "[TEST] save(my_rsi) failed\n";
        return 1;
    }
    if (std::filesystem::exists(dir / "strategies.json.tmp")) {
        std::cerr << "[TEST] temporary file left behind\n";
        return 1;
    }

    core::StrategyStoreJson reopened(path);
    const auto loaded = reopened.load("my_rsi");
    if (loaded.name != "my_rsi" ||
        loaded.display_name != "RSI Reversal Strategy" ||
        loaded.initial_capital != 12345.0 ||
        loaded.signal_type != strategy::SignalType::RSI_REVERSAL ||
        loaded.take_profit.levels_pct != custom.take_profit.levels_pct) {
        std::cerr << "[TEST] loaded strategy differs from saved one\n";
        return 1;
    }
    if (!reopened.contains("macd_momentum")) {
        std::cerr << "[TEST] earlier entries should survive a save\n";
        return 1;
    }

    // Keys the config does not model are kept across saves.
    {
        std::ifstream in(path);
        nlohmann::json doc;
        in >> doc;
        doc["my_rsi"]["notes"] = "keep me";
        in.close();
        std::ofstream out(path, std::ios::trunc);
        out << doc.dump(2);
    }
    custom.initial_capital = 20000.0;
    if (!store.save("my_rsi", custom)) {
        std::cerr << "[TEST] re-save failed\n";
        return 1;
    }
    {
        std::ifstream in(path);
        nlohmann::json doc;
        in >> doc;
        if (doc["my_rsi"].value("notes", "") != "keep me" ||
            doc["my_rsi"]["portfolio"]["size"].get<double>() != 20000.0) {
            std::cerr << "[TEST] re-save should update fields and keep extra keys\n";
            return 1;
        }
    }

    // Invalid configs are never persisted.
    auto invalid = custom;
    invalid.stop_loss.value_pct = 0.0;
    thrown = false;
    try {
        store.save("broken", invalid);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    if (!thrown || store.contains("broken")) {
        std::cerr << "[TEST] invalid config should be rejected\n";
        return 1;
    }

    // A corrupt document is reported, not overwritten.
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    thrown = false;
    try {
        store.load("my_rsi");
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    if (!thrown) {
        std::cerr << "[TEST] corrupt document should raise ConfigurationError\n";
        return 1;
    }
    if (store.save("my_rsi", custom)) {
        std::cerr << "[TEST] save over corrupt document should fail\n";
        return 1;
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] StrategyStore PASSED\n";
    return 0;
}
