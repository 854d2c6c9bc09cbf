#pragma once

#include <chrono>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "trade_recon/core/recon_config.h"

namespace trade_recon {

using LogFields = std::vector<std::pair<std::string, std::string>>;

inline std::string NormalizeLogLevel(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (value == "warning") {
        return "warn";
    }
    return value;
}

inline bool IsKnownLogLevel(const std::string& level) {
    const auto normalized = NormalizeLogLevel(level);
    return normalized == "debug" || normalized == "info" || normalized == "warn" ||
           normalized == "error";
}

inline int LogLevelRank(const std::string& level) {
    const auto normalized = NormalizeLogLevel(level);
    if (normalized == "debug") {
        return 10;
    }
    if (normalized == "info") {
        return 20;
    }
    if (normalized == "warn") {
        return 30;
    }
    if (normalized == "error") {
        return 40;
    }
    return 20;
}

inline std::string EscapeLogValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const char ch : value) {
        if (ch == '"' || ch == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

inline std::int64_t LogNowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

inline bool ShouldEmitLog(const LogConfig* log, const std::string& level) {
    const std::string configured_level = log == nullptr ? "info" : log->log_level;
    return LogLevelRank(level) >= LogLevelRank(configured_level);
}

inline std::string FormatStructuredLog(const std::string& app,
                                       const std::string& level,
                                       const std::string& event,
                                       const LogFields& fields) {
    std::string line = "ts_ns=" + std::to_string(LogNowNs()) + " level=" +
                       NormalizeLogLevel(level) + " app=" + app + " event=" + event;
    for (const auto& [key, value] : fields) {
        line += " " + key + "=\"" + EscapeLogValue(value) + "\"";
    }
    return line;
}

inline void EmitStructuredLog(const LogConfig* log,
                              const std::string& app,
                              const std::string& level,
                              const std::string& event,
                              const LogFields& fields = {}) {
    if (!ShouldEmitLog(log, level)) {
        return;
    }

    std::ostream* out = &std::cerr;
    if (log != nullptr && NormalizeLogLevel(log->log_sink) == "stdout") {
        out = &std::cout;
    }
    (*out) << FormatStructuredLog(app, level, event, fields) << '\n';
}

}  // namespace trade_recon
