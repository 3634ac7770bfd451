// File: config_tests.cpp
// Description: Environment-driven configuration defaults, overrides and
//              rejection of malformed values.

#include "test_support.hpp"

#include "compliance/Config.hpp"

#include <map>

using compliance::AppConfig;

static AppConfig::EnvLookup fakeEnv(const std::map<std::string, std::string>& values)
{
    return [values](const char* key) -> const char* {
        const auto it = values.find(key);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

static bool rejects(const std::map<std::string, std::string>& values)
{
    try {
        AppConfig::fromEnvironment(fakeEnv(values));
    } catch (const compliance::InvalidParameters&) {
        return true;
    }
    return false;
}

static int test_defaults(void)
{
    const AppConfig config = AppConfig::fromEnvironment(fakeEnv({}));
    EXPECT(config.database.host == "localhost", "default host");
    EXPECT(config.database.port == 3306u, "default MySQL port");
    EXPECT(config.database.user == "root", "default user");
    EXPECT(config.database.password.empty(), "no default password");
    EXPECT(config.database.database == "gibbon", "default schema");
    EXPECT(config.policy.ageGroups().size() == 4, "Quebec policy by default");
    EXPECT(!config.defaultPeriod, "no default school period");
    EXPECT(testing_support::nearlyEqual(config.warningThreshold, 90.0), "default warning threshold");
    EXPECT(config.retentionDays == 365, "default retention");
    EXPECT(config.port == 8080, "default HTTP port");
    EXPECT(config.logFile == "logs/ratiowatch.log", "default log file");
    return 0;
}

static int test_overrides(void)
{
    const AppConfig config = AppConfig::fromEnvironment(fakeEnv({
        {"RATIOWATCH_DB_HOST", "db.internal"},
        {"RATIOWATCH_DB_PORT", "3307"},
        {"RATIOWATCH_DB_USER", "ratios"},
        {"RATIOWATCH_DB_NAME", "gibbon_prod"},
        {"RATIOWATCH_RATIO_POLICY", "Nursery=3@0-24;Juniors=12@24-"},
        {"RATIOWATCH_SCHOOL_PERIOD", "25"},
        {"RATIOWATCH_WARNING_THRESHOLD", "85"},
        {"RATIOWATCH_RETENTION_DAYS", "30"},
        {"RATIOWATCH_PORT", "9090"},
        {"RATIOWATCH_LOG_FILE", "/tmp/ratios.log"},
        {"MYSQL_PWD", "fallback"},
    }));
    EXPECT(config.database.host == "db.internal" && config.database.port == 3307u, "database endpoint");
    EXPECT(config.database.user == "ratios" && config.database.database == "gibbon_prod", "credentials");
    EXPECT(config.database.password == "fallback", "MYSQL_PWD used when no explicit password");
    EXPECT(config.policy.lookup("Nursery")->maxChildrenPerStaff == 3, "policy override");
    EXPECT(!config.policy.lookup("Infant"), "override replaces defaults");
    EXPECT(config.defaultPeriod == 25u, "school period");
    EXPECT(testing_support::nearlyEqual(config.warningThreshold, 85.0), "threshold");
    EXPECT(config.retentionDays == 30 && config.port == 9090, "retention and port");
    EXPECT(config.logFile == "/tmp/ratios.log", "log file");
    return 0;
}

static int test_largest_period_accepted(void)
{
    const AppConfig config = AppConfig::fromEnvironment(fakeEnv({{"RATIOWATCH_SCHOOL_PERIOD", "2147483647"}}));
    EXPECT(config.defaultPeriod == static_cast<compliance::SchoolPeriodId>(compliance::kMaxSchoolPeriodId),
           "largest school period accepted");
    return 0;
}

static int test_explicit_password_wins(void)
{
    const AppConfig config = AppConfig::fromEnvironment(fakeEnv({
        {"RATIOWATCH_DB_PASSWORD", "explicit"},
        {"MYSQL_PWD", "fallback"},
    }));
    EXPECT(config.database.password == "explicit", "explicit password preferred");
    return 0;
}

static int test_malformed_values_rejected(void)
{
    EXPECT(rejects({{"RATIOWATCH_PORT", "80"}}), "privileged port rejected");
    EXPECT(rejects({{"RATIOWATCH_PORT", "70000"}}), "port above range rejected");
    EXPECT(rejects({{"RATIOWATCH_DB_PORT", "abc"}}), "non-numeric port rejected");
    EXPECT(rejects({{"RATIOWATCH_SCHOOL_PERIOD", "0"}}), "zero period rejected");
    EXPECT(rejects({{"RATIOWATCH_SCHOOL_PERIOD", "2147483648"}}), "period above the shared bound rejected");
    EXPECT(rejects({{"RATIOWATCH_RETENTION_DAYS", "36501"}}), "retention above a century rejected");
    EXPECT(rejects({{"RATIOWATCH_RETENTION_DAYS", "-5"}}), "negative retention rejected");
    EXPECT(rejects({{"RATIOWATCH_WARNING_THRESHOLD", "9O"}}), "trailing garbage rejected");
    EXPECT(rejects({{"RATIOWATCH_RATIO_POLICY", "Infant=5"}}), "malformed policy rejected");
    return 0;
}

int main(void)
{
    if (test_defaults() != 0) return 1;
    if (test_overrides() != 0) return 1;
    if (test_largest_period_accepted() != 0) return 1;
    if (test_explicit_password_wins() != 0) return 1;
    if (test_malformed_values_rejected() != 0) return 1;
    return 0;
}
