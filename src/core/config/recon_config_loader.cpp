#include "trade_recon/core/recon_config_loader.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "trade_recon/core/structured_log.h"

namespace trade_recon {
namespace {

std::string TrimSpace(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string Trim(std::string value) {
    value = TrimSpace(std::move(value));
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Lowercase(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string StripInlineComment(const std::string& input) {
    bool in_single_quote = false;
    bool in_double_quote = false;
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if (ch == '\'' && !in_double_quote) {
            in_single_quote = !in_single_quote;
            continue;
        }
        if (ch == '"' && !in_single_quote) {
            in_double_quote = !in_double_quote;
            continue;
        }
        if (ch == '#' && !in_single_quote && !in_double_quote) {
            return input.substr(0, i);
        }
    }
    return input;
}

bool LoadSimpleYaml(const std::string& path,
                    std::unordered_map<std::string, std::string>* kv,
                    std::string* error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open config: " + path;
        }
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        line = TrimSpace(StripInlineComment(line));
        if (line.empty() || line == "recon:") {
            continue;
        }

        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const auto key = Trim(line.substr(0, pos));
        auto value = Trim(line.substr(pos + 1));
        if (!key.empty()) {
            (*kv)[key] = value;
        }
    }
    return true;
}

bool ParseBoolValue(const std::string& value, bool* out) {
    if (out == nullptr) {
        return false;
    }
    const auto normalized = Lowercase(Trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes") {
        *out = true;
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no") {
        *out = false;
        return true;
    }
    return false;
}

std::vector<std::string> SplitCsvList(const std::string& raw) {
    std::vector<std::string> values;
    std::size_t start = 0;
    while (start <= raw.size()) {
        const auto end = raw.find(',', start);
        const auto item = end == std::string::npos ? raw.substr(start) : raw.substr(start, end - start);
        const auto trimmed = Trim(item);
        if (!trimmed.empty()) {
            values.push_back(trimmed);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return values;
}

}  // namespace

bool ReconConfigValidator::Validate(const ReconConfig& config, std::string* error) {
    auto fail = [error](const std::string& message) {
        if (error != nullptr) {
            *error = message;
        }
        return false;
    };
    if (config.trading_currency.empty()) {
        return fail("trading_currency must not be empty");
    }
    if (config.domestic_currency.empty()) {
        return fail("domestic_currency must not be empty");
    }
    if (config.buy_keywords.empty()) {
        return fail("buy_keywords must not be empty");
    }
    if (config.sell_keywords.empty()) {
        return fail("sell_keywords must not be empty");
    }
    if (config.total_row_label.empty()) {
        return fail("total_row_label must not be empty");
    }
    if (!IsKnownLogLevel(config.log.log_level)) {
        return fail("invalid log_level: " + config.log.log_level);
    }
    const auto sink = NormalizeLogLevel(config.log.log_sink);
    if (sink != "stderr" && sink != "stdout") {
        return fail("invalid log_sink: " + config.log.log_sink);
    }
    return true;
}

bool ReconConfigLoader::LoadFromYaml(const std::string& path,
                                     ReconConfig* config,
                                     std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    std::unordered_map<std::string, std::string> kv;
    if (!LoadSimpleYaml(path, &kv, error)) {
        return false;
    }

    ReconConfig loaded;
    auto get_value = [&](const char* key) -> std::string {
        const auto it = kv.find(key);
        if (it == kv.end()) {
            return "";
        }
        return it->second;
    };

    if (kv.count("trading_currency") != 0) {
        loaded.trading_currency = get_value("trading_currency");
    }
    if (kv.count("domestic_currency") != 0) {
        loaded.domestic_currency = get_value("domestic_currency");
    }
    loaded.rate_currency_label = get_value("rate_currency_label");
    if (kv.count("buy_keywords") != 0) {
        loaded.buy_keywords = SplitCsvList(get_value("buy_keywords"));
    }
    if (kv.count("sell_keywords") != 0) {
        loaded.sell_keywords = SplitCsvList(get_value("sell_keywords"));
    }
    if (kv.count("prior_lot_keywords") != 0) {
        loaded.prior_lot_keywords = SplitCsvList(get_value("prior_lot_keywords"));
    }
    if (!get_value("borrowed_operation_label").empty()) {
        loaded.borrowed_operation_label = get_value("borrowed_operation_label");
    }
    if (kv.count("total_row_label") != 0) {
        loaded.total_row_label = get_value("total_row_label");
    }
    if (const auto it = kv.find("filter_by_currency"); it != kv.end()) {
        if (!ParseBoolValue(it->second, &loaded.filter_by_currency)) {
            if (error != nullptr) {
                *error = "invalid bool value for filter_by_currency";
            }
            return false;
        }
    }
    if (!get_value("log_level").empty()) {
        loaded.log.log_level = NormalizeLogLevel(get_value("log_level"));
    }
    if (!get_value("log_sink").empty()) {
        loaded.log.log_sink = get_value("log_sink");
    }
    if (const char* env_level = std::getenv("TRADE_RECON_LOG_LEVEL");
        env_level != nullptr && env_level[0] != '\0') {
        loaded.log.log_level = NormalizeLogLevel(env_level);
    }

    std::string validation_error;
    if (!ReconConfigValidator::Validate(loaded, &validation_error)) {
        if (error != nullptr) {
            *error = "recon config validation failed: " + validation_error;
        }
        return false;
    }

    *config = std::move(loaded);
    return true;
}

}  // namespace trade_recon
