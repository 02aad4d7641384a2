#pragma once

#include <string>
#include <vector>
#include "config_manager.hpp"
#include "../core/result.hpp"

namespace xvh {

struct ValidationIssue {
    std::string field;
    std::string message;
};

class ConfigValidator {
public:
    using ValidationResult = Result<bool>;
    using ValidationIssues = std::vector<ValidationIssue>;

    // Validates every section and returns the first failure; all issues found
    // remain available through issues().
    ValidationResult validate(ConfigManager& config);

    const ValidationIssues& issues() const { return issues_; }

private:
    void validate_venues(ConfigManager& config);
    void validate_trading(const TradingConfig& trading);
    void validate_hedge(const HedgeConfig& hedge);
    void validate_database(const DatabaseConfig& database);
    void validate_logging(const LoggingConfig& logging);

    void add_issue(const std::string& field, const std::string& message);

    ValidationIssues issues_;
};

} // namespace xvh
