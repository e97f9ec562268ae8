#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IStrategyStore.h"

namespace tradelab {
namespace core {

// One JSON document holding every saved strategy keyed by name.
// Entries keep keys this code does not model (validation rules, notes) across saves.
class StrategyStoreJson : public IStrategyStore {
public:
    explicit StrategyStoreJson(std::filesystem::path file_path);

    strategy::StrategyConfig load(const std::string& name) override;
    bool save(const std::string& name, const strategy::StrategyConfig& config) override;
    bool contains(const std::string& name) override;
    std::vector<std::string> list() override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    // nullopt when the file is missing; throws ConfigurationError when it is not a JSON object.
    std::optional<nlohmann::json> readDocument() const;
    bool writeDocument(const nlohmann::json& doc) const;

    std::filesystem::path file_path_;
};

} // namespace core
} // namespace tradelab
