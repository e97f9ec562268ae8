#include "core/state/StrategyStoreJson.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace tradelab {
namespace core {

StrategyStoreJson::StrategyStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<nlohmann::json> StrategyStoreJson::readDocument() const {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(file_path_.string(), std::string("not valid JSON: ") + e.what());
    }
    if (!raw.is_object()) {
        throw ConfigurationError(file_path_.string(), "top level must map strategy names to configs");
    }
    return raw;
}

bool StrategyStoreJson::writeDocument(const nlohmann::json& doc) const {
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << doc.dump(4);
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Some filesystems refuse to rename over an existing file; fall back to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

strategy::StrategyConfig StrategyStoreJson::load(const std::string& name) {
    const auto doc = readDocument();
    if (!doc || !doc->contains(name)) {
        throw StrategyNotFoundError(name);
    }
    return strategy::strategyConfigFromJson(name, doc->at(name));
}

bool StrategyStoreJson::save(const std::string& name, const strategy::StrategyConfig& config) {
    config.validate();

    nlohmann::json doc = nlohmann::json::object();
    try {
        if (auto existing = readDocument()) {
            doc = std::move(*existing);
        }
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Refusing to overwrite unreadable strategy file: {}", e.what());
        return false;
    }

    auto entry = strategy::strategyConfigToJson(config);
    if (doc.contains(name) && doc[name].is_object()) {
        doc[name].update(entry);
    } else {
        doc[name] = std::move(entry);
    }

    if (!writeDocument(doc)) {
        LOG_ERROR("Failed to write strategy file: {}", file_path_.string());
        return false;
    }
    LOG_INFO("Strategy '{}' saved to {}", name, file_path_.string());
    return true;
}

bool StrategyStoreJson::contains(const std::string& name) {
    const auto doc = readDocument();
    return doc && doc->contains(name);
}

std::vector<std::string> StrategyStoreJson::list() {
    std::vector<std::string> names;
    const auto doc = readDocument();
    if (!doc) {
        return names;
    }
    for (const auto& [key, _] : doc->items()) {
        names.push_back(key);
    }
    return names;
}

} // namespace core
} // namespace tradelab
