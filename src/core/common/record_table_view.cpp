#include "trade_recon/core/record_table_view.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace trade_recon {
namespace {

std::string AsciiLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Length of a Unicode space sequence (U+00A0, U+2009, U+202F) starting at pos, 0 if none.
std::size_t UnicodeSpaceLength(const std::string& text, std::size_t pos) {
    const auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
    if (pos + 1 < text.size() && byte(pos) == 0xC2 && byte(pos + 1) == 0xA0) {
        return 2;
    }
    if (pos + 2 < text.size() && byte(pos) == 0xE2 && byte(pos + 1) == 0x80 &&
        (byte(pos + 2) == 0xAF || byte(pos + 2) == 0x89)) {
        return 3;
    }
    return 0;
}

bool IsUnicodeSpaceSuffix(const std::string& text, std::size_t end, std::size_t* length) {
    if (end >= 2 && UnicodeSpaceLength(text, end - 2) == 2) {
        *length = 2;
        return true;
    }
    if (end >= 3 && UnicodeSpaceLength(text, end - 3) == 3) {
        *length = 3;
        return true;
    }
    return false;
}

}  // namespace

std::optional<std::size_t> RecordTableView::FindColumn(
    std::initializer_list<const char*> aliases) const {
    for (const char* alias : aliases) {
        const std::string wanted = AsciiLower(alias);
        for (std::size_t i = 0; i < table_.columns.size(); ++i) {
            if (AsciiLower(TrimCell(table_.columns[i])) == wanted) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::string RecordTableView::Cell(std::size_t row, std::size_t column) const {
    if (row >= table_.rows.size()) {
        return "";
    }
    const auto& cells = table_.rows[row];
    if (column >= cells.size()) {
        return "";
    }
    return cells[column];
}

std::string TrimCell(const std::string& text) {
    std::size_t begin = 0;
    while (begin < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
            ++begin;
            continue;
        }
        const std::size_t unicode = UnicodeSpaceLength(text, begin);
        if (unicode == 0) {
            break;
        }
        begin += unicode;
    }
    std::size_t end = text.size();
    while (end > begin) {
        if (std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
            --end;
            continue;
        }
        std::size_t length = 0;
        if (!IsUnicodeSpaceSuffix(text, end, &length) || end - length < begin) {
            break;
        }
        end -= length;
    }
    return text.substr(begin, end - begin);
}

std::string NormalizeNumericText(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char ch = text[pos];
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            ++pos;
            continue;
        }
        const std::size_t unicode = UnicodeSpaceLength(text, pos);
        if (unicode > 0) {
            pos += unicode;
            continue;
        }
        normalized.push_back(ch == ',' ? '.' : ch);
        ++pos;
    }
    return normalized;
}

bool ParseDecimalCell(const std::string& text, Decimal* out, std::string* error) {
    const std::string normalized = NormalizeNumericText(text);
    if (normalized.empty()) {
        if (error != nullptr) {
            *error = "empty numeric value";
        }
        return false;
    }
    return Decimal::Parse(normalized, out, error);
}

bool ParseTimestampCell(const std::string& text, Timestamp* out, std::string* error) {
    const std::string trimmed = TrimCell(text);
    if (trimmed.empty()) {
        if (error != nullptr) {
            *error = "empty date value";
        }
        return false;
    }
    if (!Timestamp::TryParse(trimmed, out)) {
        if (error != nullptr) {
            *error = "invalid date value: '" + trimmed + "'";
        }
        return false;
    }
    return true;
}

}  // namespace trade_recon
