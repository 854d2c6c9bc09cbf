#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "trade_recon/core/recon_config.h"

namespace trade_recon {

enum class ReconErrorCode {
    kRowParse,
    kMissingColumn,
    kSchema,
    kNoRateFound,
    kInsufficientPriorData,
    kEmptyInput,
    kUnresolvedOperation,
    kCurrencyFiltered,
    kPriorSourceRejected,
    kOverflow,
};

enum class DiagnosticLevel {
    kInfo,
    kWarn,
    kError,
};

const char* ReconErrorCodeName(ReconErrorCode code);
const char* DiagnosticLevelName(DiagnosticLevel level);

// kSchema, kEmptyInput and kOverflow abort a run; every other code is recovered locally.
bool IsFatalCode(ReconErrorCode code);

struct ReconDiagnostic {
    ReconErrorCode code{ReconErrorCode::kRowParse};
    DiagnosticLevel level{DiagnosticLevel::kWarn};
    std::string source;
    std::string ticker;
    std::optional<std::size_t> row;
    std::string message;
};

// Collects recovered row/ticker-scoped issues of one run and mirrors each one to the
// structured log as it is recorded.
class DiagnosticLog {
public:
    explicit DiagnosticLog(const LogConfig* log = nullptr) : log_(log) {}

    void Record(ReconDiagnostic diagnostic);
    void Record(ReconErrorCode code,
                DiagnosticLevel level,
                const std::string& source,
                const std::string& message,
                const std::string& ticker = "",
                std::optional<std::size_t> row = std::nullopt);

    const std::vector<ReconDiagnostic>& entries() const { return entries_; }
    std::size_t Count(ReconErrorCode code) const;
    bool Has(ReconErrorCode code) const { return Count(code) > 0; }

private:
    const LogConfig* log_{nullptr};
    std::vector<ReconDiagnostic> entries_;
};

// Formats a table-scoped failure as "<code_name>: <message>".
std::string FormatFatal(ReconErrorCode code, const std::string& message);

}  // namespace trade_recon
