#pragma once

#include <stdexcept>
#include <string>

namespace tradelab {

// Malformed or missing StrategyConfig field. Fatal to the run that raised it.
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& field, const std::string& reason)
        : std::runtime_error("invalid strategy config '" + field + "': " + reason)
        , field_(field)
        , reason_(reason) {}

    const std::string& field() const { return field_; }
    const std::string& reason() const { return reason_; }

private:
    std::string field_;
    std::string reason_;
};

class StrategyNotFoundError : public std::runtime_error {
public:
    explicit StrategyNotFoundError(const std::string& name)
        : std::runtime_error("strategy not found: " + name)
        , name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

} // namespace tradelab
