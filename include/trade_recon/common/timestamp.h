#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace trade_recon {

using EpochSeconds = std::int64_t;

class Timestamp {
public:
    Timestamp() = default;
    explicit Timestamp(EpochSeconds seconds) : seconds_(seconds) {}

    // ISO dates and the day-first dotted form used by broker and central-bank tables.
    static bool TryParse(const std::string& text, Timestamp* out) {
        if (out == nullptr) {
            return false;
        }
        static const char* const kFormats[] = {
            "%Y-%m-%d %H:%M:%S",
            "%Y-%m-%dT%H:%M:%S",
            "%Y-%m-%d",
            "%d.%m.%Y %H:%M:%S",
            "%d.%m.%Y",
        };
        for (const char* format : kFormats) {
            std::tm tm = {};
            tm.tm_isdst = 0;
            std::istringstream iss(text);
            iss >> std::get_time(&tm, format);
            if (iss.fail()) {
                continue;
            }
            iss >> std::ws;
            if (!iss.eof()) {
                continue;
            }
            // timegm rolls 2024-02-31 over to 2024-03-02; such dates are rejected.
            std::tm normalized = tm;
            const auto seconds = static_cast<EpochSeconds>(timegm(&normalized));
            if (normalized.tm_year != tm.tm_year || normalized.tm_mon != tm.tm_mon ||
                normalized.tm_mday != tm.tm_mday) {
                return false;
            }
            *out = Timestamp(seconds);
            return true;
        }
        return false;
    }

    static Timestamp FromText(const std::string& text) {
        Timestamp parsed;
        if (!TryParse(text, &parsed)) {
            throw std::runtime_error("invalid timestamp format: " + text);
        }
        return parsed;
    }

    static Timestamp Now() {
        const auto now = std::chrono::time_point_cast<std::chrono::seconds>(
            std::chrono::system_clock::now());
        return Timestamp(now.time_since_epoch().count());
    }

    std::string ToDate() const {
        const auto seconds = static_cast<std::time_t>(seconds_);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d");
        return oss.str();
    }

    std::string ToText() const {
        const auto seconds = static_cast<std::time_t>(seconds_);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    EpochSeconds ToEpochSeconds() const { return seconds_; }

    bool operator>(const Timestamp& other) const { return seconds_ > other.seconds_; }
    bool operator<(const Timestamp& other) const { return seconds_ < other.seconds_; }
    bool operator>=(const Timestamp& other) const { return seconds_ >= other.seconds_; }
    bool operator<=(const Timestamp& other) const { return seconds_ <= other.seconds_; }
    bool operator==(const Timestamp& other) const { return seconds_ == other.seconds_; }
    bool operator!=(const Timestamp& other) const { return seconds_ != other.seconds_; }

private:
    EpochSeconds seconds_{0};
};

}  // namespace trade_recon
