//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Define pia-nm error codes and a method to convert them to a string representation

#ifndef PIANM_ERROR_ERROR_H
#define PIANM_ERROR_ERROR_H

#include <cstddef>

namespace pianm {
namespace Error {

enum Type
{
    SUCCESS = 0,            // no error
    STARTUP_FAILED,         // service client or loop thread could not be created
    NOT_ON_LOOP_THREAD,     // service object touched from a foreign thread
    OPERATION_FAILED,       // service-level error (domain, code, message)
    DEVICE_NOT_FOUND,       // active connection reports no device
    SNAPSHOT_UNAVAILABLE,   // applied connection could not be read
    MISSING_CONFIG_SECTION, // settings lack the wireguard section
    REAPPLY_FAILED,         // live reapply rejected, often a stale version id
    UPDATE_SAVED_FAILED,    // saved profile could not be updated
    CONNECTION_NOT_FOUND,   // no connection with the requested id
    OPERATION_TIMEOUT,      // await timed out, outcome unknown
    PROFILE_INVALID,        // profile descriptor failed validation
    CONFIG_ERROR,           // bad configuration file
    N_ERRORS,
};

inline const char *name(const std::size_t type)
{
    static const char *names[] = {
        "SUCCESS",
        "STARTUP_FAILED",
        "NOT_ON_LOOP_THREAD",
        "OPERATION_FAILED",
        "DEVICE_NOT_FOUND",
        "SNAPSHOT_UNAVAILABLE",
        "MISSING_CONFIG_SECTION",
        "REAPPLY_FAILED",
        "UPDATE_SAVED_FAILED",
        "CONNECTION_NOT_FOUND",
        "OPERATION_TIMEOUT",
        "PROFILE_INVALID",
        "CONFIG_ERROR",
    };

    static_assert(N_ERRORS == sizeof(names) / sizeof(names[0]), "error names array inconsistency");
    if (type < N_ERRORS)
        return names[type];
    else
        return "UNKNOWN_ERROR_TYPE";
}

} // namespace Error
} // namespace pianm

#endif
