//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

#ifndef PIANM_LOG_LOGREDACT_H
#define PIANM_LOG_LOGREDACT_H

#include <string>
#include <regex>

namespace pianm {
namespace LogRedact {

// Scrub key material and credentials out of a log line.  WireGuard
// keys are 44 base64 characters, tokens are longer still.
inline std::string redact(const std::string &line)
{
#ifdef PIANM_LOG_NO_REDACT
    return line;
#else
    static const std::regex base64_re("[A-Za-z0-9+/]{40,}={0,2}");
    static const std::regex assign_re("\\b(token|password|key|credential)([\"']?\\s*[:=]\\s*[\"']?)[^\"'\\s,}]+",
                                      std::regex_constants::ECMAScript | std::regex_constants::icase);
    std::string ret = std::regex_replace(line, base64_re, "[REDACTED_BASE64]");
    return std::regex_replace(ret, assign_re, "$1$2[REDACTED]");
#endif
}

} // namespace LogRedact
} // namespace pianm

#endif
