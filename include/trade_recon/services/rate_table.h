#pragma once

#include <optional>
#include <string>
#include <vector>

#include "trade_recon/contracts/types.h"
#include "trade_recon/core/recon_config.h"
#include "trade_recon/core/recon_diagnostics.h"

namespace trade_recon {

// Immutable date-ordered rate series for one currency pair.
class RateTable {
public:
    RateTable() = default;
    // Sorts ascending by date; on duplicate dates the entry given last wins.
    explicit RateTable(std::vector<RateEntry> entries);

    // Rate of the latest entry dated on or before `as_of`; nullopt if the table starts later.
    std::optional<Decimal> Lookup(const Timestamp& as_of) const;

    // Aligned with `trades`.
    std::vector<std::optional<Decimal>> ResolveAsOf(const std::vector<Trade>& trades) const;

    const std::vector<RateEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

private:
    std::vector<RateEntry> entries_;
};

// Missing date or rate column is fatal; bad rows are skipped.
bool BuildRateTable(const RecordTable& records,
                    const ReconConfig& config,
                    RateTable* out,
                    DiagnosticLog* diagnostics,
                    std::string* error);

}  // namespace trade_recon
