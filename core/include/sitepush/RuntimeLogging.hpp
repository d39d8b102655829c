// Runtime policy helpers for protocol diagnostics.
#pragma once

#include "RemoteTypes.hpp"

#include <cctype>
#include <string>

namespace sitepush {

inline std::string trimmedLine(const std::string &raw) {
    std::size_t start = 0;
    while (start < raw.size() &&
           std::isspace(static_cast<unsigned char>(raw[start]))) {
        ++start;
    }
    std::size_t end = raw.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(raw[end - 1]))) {
        --end;
    }
    return raw.substr(start, end - start);
}

inline bool startsWithNoCase(const std::string &s, const char *prefix) {
    std::size_t i = 0;
    for (; prefix[i] != '\0'; ++i) {
        if (i >= s.size())
            return false;
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

// Credentials never reach the log, verbose or not.
inline std::string redactProtocolLine(const std::string &raw) {
    const std::string line = trimmedLine(raw);
    if (startsWithNoCase(line, "PASS ") || startsWithNoCase(line, "PASS\t"))
        return "PASS ****";
    if (startsWithNoCase(line, "ACCT "))
        return "ACCT ****";
    return line;
}

inline void traceProtocol(const SessionOptions &opt, const std::string &raw) {
    if (!opt.verbose || !opt.trace_cb)
        return;
    const std::string line = redactProtocolLine(raw);
    if (!line.empty())
        opt.trace_cb(line);
}

} // namespace sitepush
