#include "trade_recon/core/recon_diagnostics.h"

#include <algorithm>
#include <string>
#include <utility>

#include "trade_recon/core/structured_log.h"

namespace trade_recon {

const char* ReconErrorCodeName(ReconErrorCode code) {
    switch (code) {
        case ReconErrorCode::kRowParse:
            return "row_parse_error";
        case ReconErrorCode::kMissingColumn:
            return "missing_column";
        case ReconErrorCode::kSchema:
            return "schema_error";
        case ReconErrorCode::kNoRateFound:
            return "no_rate_found";
        case ReconErrorCode::kInsufficientPriorData:
            return "insufficient_prior_data";
        case ReconErrorCode::kEmptyInput:
            return "empty_input";
        case ReconErrorCode::kUnresolvedOperation:
            return "unresolved_operation";
        case ReconErrorCode::kCurrencyFiltered:
            return "currency_filtered";
        case ReconErrorCode::kPriorSourceRejected:
            return "prior_source_rejected";
        case ReconErrorCode::kOverflow:
            return "overflow";
    }
    return "unknown";
}

const char* DiagnosticLevelName(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::kInfo:
            return "info";
        case DiagnosticLevel::kWarn:
            return "warn";
        case DiagnosticLevel::kError:
            return "error";
    }
    return "info";
}

bool IsFatalCode(ReconErrorCode code) {
    return code == ReconErrorCode::kSchema || code == ReconErrorCode::kEmptyInput ||
           code == ReconErrorCode::kOverflow;
}

void DiagnosticLog::Record(ReconDiagnostic diagnostic) {
    LogFields fields{{"code", ReconErrorCodeName(diagnostic.code)},
                     {"source", diagnostic.source}};
    if (!diagnostic.ticker.empty()) {
        fields.emplace_back("ticker", diagnostic.ticker);
    }
    if (diagnostic.row.has_value()) {
        fields.emplace_back("row", std::to_string(*diagnostic.row));
    }
    fields.emplace_back("message", diagnostic.message);
    EmitStructuredLog(log_,
                      "trade_recon",
                      DiagnosticLevelName(diagnostic.level),
                      ReconErrorCodeName(diagnostic.code),
                      fields);
    entries_.push_back(std::move(diagnostic));
}

void DiagnosticLog::Record(ReconErrorCode code,
                           DiagnosticLevel level,
                           const std::string& source,
                           const std::string& message,
                           const std::string& ticker,
                           std::optional<std::size_t> row) {
    ReconDiagnostic diagnostic;
    diagnostic.code = code;
    diagnostic.level = level;
    diagnostic.source = source;
    diagnostic.ticker = ticker;
    diagnostic.row = row;
    diagnostic.message = message;
    Record(std::move(diagnostic));
}

std::size_t DiagnosticLog::Count(ReconErrorCode code) const {
    return static_cast<std::size_t>(
        std::count_if(entries_.begin(), entries_.end(), [code](const ReconDiagnostic& entry) {
            return entry.code == code;
        }));
}

std::string FormatFatal(ReconErrorCode code, const std::string& message) {
    return std::string(ReconErrorCodeName(code)) + ": " + message;
}

}  // namespace trade_recon
