#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "trade_recon/core/recon_config_loader.h"

namespace trade_recon {
namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, const char* value) : key_(std::move(key)) {
        const char* previous = std::getenv(key_.c_str());
        if (previous != nullptr) {
            had_previous_ = true;
            previous_value_ = previous;
        }
        if (value == nullptr) {
            unsetenv(key_.c_str());
        } else {
            setenv(key_.c_str(), value, 1);
        }
    }

    ~ScopedEnvVar() {
        if (had_previous_) {
            setenv(key_.c_str(), previous_value_.c_str(), 1);
            return;
        }
        unsetenv(key_.c_str());
    }

private:
    std::string key_;
    bool had_previous_{false};
    std::string previous_value_;
};

std::filesystem::path WriteTempConfig(const std::string& body) {
    const auto token =
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    const auto path = std::filesystem::temp_directory_path() /
                      ("trade_recon_config_loader_test_" + token + ".yaml");
    std::ofstream out(path);
    out << body;
    return path;
}

}  // namespace

TEST(ReconConfigLoaderTest, LoadsAllKeys) {
    const ScopedEnvVar env("TRADE_RECON_LOG_LEVEL", nullptr);
    const auto path = WriteTempConfig(
        "recon:\n"
        "  trading_currency: EUR  # only euro trades\n"
        "  domestic_currency: \"RUB\"\n"
        "  rate_currency_label: 'Евро'\n"
        "  buy_keywords: buy, purchase\n"
        "  sell_keywords: sell\n"
        "  prior_lot_keywords: открыт, opening\n"
        "  borrowed_operation_label: Carried lot\n"
        "  total_row_label: Итого\n"
        "  filter_by_currency: false\n"
        "  log_level: WARNING\n"
        "  log_sink: stdout\n");

    ReconConfig config;
    std::string error;
    ASSERT_TRUE(ReconConfigLoader::LoadFromYaml(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.trading_currency, "EUR");
    EXPECT_EQ(config.domestic_currency, "RUB");
    EXPECT_EQ(config.rate_currency_label, "Евро");
    ASSERT_EQ(config.buy_keywords.size(), 2U);
    EXPECT_EQ(config.buy_keywords[1], "purchase");
    ASSERT_EQ(config.sell_keywords.size(), 1U);
    ASSERT_EQ(config.prior_lot_keywords.size(), 2U);
    EXPECT_EQ(config.prior_lot_keywords[1], "opening");
    EXPECT_EQ(config.borrowed_operation_label, "Carried lot");
    EXPECT_EQ(config.total_row_label, "Итого");
    EXPECT_FALSE(config.filter_by_currency);
    EXPECT_EQ(config.log.log_level, "warn");
    EXPECT_EQ(config.log.log_sink, "stdout");
    std::filesystem::remove(path);
}

TEST(ReconConfigLoaderTest, MissingKeysKeepDefaults) {
    const ScopedEnvVar env("TRADE_RECON_LOG_LEVEL", nullptr);
    const auto path = WriteTempConfig("# empty config\n");

    ReconConfig config;
    std::string error;
    ASSERT_TRUE(ReconConfigLoader::LoadFromYaml(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.trading_currency, "USD");
    EXPECT_EQ(config.domestic_currency, "RUB");
    EXPECT_TRUE(config.rate_currency_label.empty());
    EXPECT_EQ(config.buy_keywords.size(), 4U);
    ASSERT_EQ(config.prior_lot_keywords.size(), 1U);
    EXPECT_EQ(config.prior_lot_keywords[0], "открыт");
    EXPECT_EQ(config.borrowed_operation_label, "Buy (prior period)");
    EXPECT_EQ(config.total_row_label, "Total");
    EXPECT_TRUE(config.filter_by_currency);
    EXPECT_EQ(config.log.log_level, "info");
    std::filesystem::remove(path);
}

TEST(ReconConfigLoaderTest, EnvOverridesLogLevel) {
    const ScopedEnvVar env("TRADE_RECON_LOG_LEVEL", "debug");
    const auto path = WriteTempConfig("log_level: error\n");

    ReconConfig config;
    std::string error;
    ASSERT_TRUE(ReconConfigLoader::LoadFromYaml(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.log.log_level, "debug");
    std::filesystem::remove(path);
}

TEST(ReconConfigLoaderTest, RejectsInvalidValues) {
    const ScopedEnvVar env("TRADE_RECON_LOG_LEVEL", nullptr);
    ReconConfig config;
    std::string error;

    auto path = WriteTempConfig("filter_by_currency: maybe\n");
    EXPECT_FALSE(ReconConfigLoader::LoadFromYaml(path.string(), &config, &error));
    EXPECT_NE(error.find("filter_by_currency"), std::string::npos);
    std::filesystem::remove(path);

    path = WriteTempConfig("trading_currency: \"\"\n");
    EXPECT_FALSE(ReconConfigLoader::LoadFromYaml(path.string(), &config, &error));
    EXPECT_NE(error.find("trading_currency"), std::string::npos);
    std::filesystem::remove(path);

    path = WriteTempConfig("buy_keywords: ,\n");
    EXPECT_FALSE(ReconConfigLoader::LoadFromYaml(path.string(), &config, &error));
    EXPECT_NE(error.find("buy_keywords"), std::string::npos);
    std::filesystem::remove(path);

    path = WriteTempConfig("log_level: verbose\n");
    EXPECT_FALSE(ReconConfigLoader::LoadFromYaml(path.string(), &config, &error));
    EXPECT_NE(error.find("log_level"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(ReconConfigLoaderTest, MissingFileFails) {
    ReconConfig config;
    std::string error;
    EXPECT_FALSE(ReconConfigLoader::LoadFromYaml("/nonexistent/trade_recon.yaml", &config, &error));
    EXPECT_NE(error.find("unable to open config"), std::string::npos);
    EXPECT_FALSE(ReconConfigLoader::LoadFromYaml("/nonexistent/trade_recon.yaml", nullptr, &error));
}

}  // namespace trade_recon
