#pragma once

#include <string>
#include <vector>

#include "trade_recon/contracts/types.h"
#include "trade_recon/core/recon_config.h"
#include "trade_recon/core/recon_diagnostics.h"

namespace trade_recon {

// Case-insensitive substring classifier over the buy and sell lexicons. Buy is tested first.
class OperationClassifier {
public:
    OperationClassifier(const std::vector<std::string>& buy_keywords,
                        const std::vector<std::string>& sell_keywords);

    OperationTag Classify(const std::string& raw_label) const;

    // Lowercases ASCII and Cyrillic letters in a UTF-8 string; other bytes pass through.
    static std::string FoldCase(const std::string& text);

private:
    static bool ContainsAny(const std::string& folded, const std::vector<std::string>& keywords);

    std::vector<std::string> buy_keywords_;
    std::vector<std::string> sell_keywords_;
};

class TradeNormalizer {
public:
    explicit TradeNormalizer(ReconConfig config);

    OperationTag NormalizeOperation(const std::string& raw_label) const;

    // False only when the ticker or operation column is missing.
    bool Normalize(const RecordTable& records,
                   TradeOrigin origin,
                   const std::string& source,
                   std::vector<Trade>* out,
                   DiagnosticLog* diagnostics,
                   std::string* error) const;

private:
    ReconConfig config_;
    OperationClassifier classifier_;
};

}  // namespace trade_recon
