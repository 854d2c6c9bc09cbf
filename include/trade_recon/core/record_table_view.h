#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>

#include "trade_recon/common/timestamp.h"
#include "trade_recon/contracts/types.h"
#include "trade_recon/core/fixed_decimal.h"

namespace trade_recon {

// Read-only accessor over a RecordTable with header aliases and padded rows.
class RecordTableView {
public:
    explicit RecordTableView(const RecordTable& table) : table_(table) {}

    std::optional<std::size_t> FindColumn(std::initializer_list<const char*> aliases) const;

    std::size_t RowCount() const { return table_.rows.size(); }
    // Empty string for cells past the end of a short row.
    std::string Cell(std::size_t row, std::size_t column) const;

private:
    const RecordTable& table_;
};

// Trims ASCII whitespace plus U+00A0 and U+202F at both ends.
std::string TrimCell(const std::string& text);

// Single coercion point for monetary and quantity cells: drops every whitespace character,
// maps ',' to '.', then parses an exact decimal.
std::string NormalizeNumericText(const std::string& text);
bool ParseDecimalCell(const std::string& text, Decimal* out, std::string* error);

bool ParseTimestampCell(const std::string& text, Timestamp* out, std::string* error);

}  // namespace trade_recon
