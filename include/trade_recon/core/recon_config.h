#pragma once

#include <string>
#include <vector>

namespace trade_recon {

struct LogConfig {
    std::string log_level{"info"};
    std::string log_sink{"stderr"};
};

struct ReconConfig {
    std::string trading_currency{"USD"};
    std::string domestic_currency{"RUB"};
    std::string rate_currency_label;
    std::vector<std::string> buy_keywords{"покуп", "купл", "buy", "purchase"};
    std::vector<std::string> sell_keywords{"продаж", "sell", "sale"};
    // Extra buy markers honored only when selecting prior-period lots.
    std::vector<std::string> prior_lot_keywords{"открыт"};
    std::string borrowed_operation_label{"Buy (prior period)"};
    std::string total_row_label{"Total"};
    bool filter_by_currency{true};
    LogConfig log;
};

class ReconConfigValidator {
public:
    static bool Validate(const ReconConfig& config, std::string* error);
};

}  // namespace trade_recon
