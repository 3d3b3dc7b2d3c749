//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

#ifndef PIANM_LOG_LOGBASE_H
#define PIANM_LOG_LOGBASE_H

#include <string>

#include <pianm/common/rc.hpp>

#define PIANM_LOG_CLASS pianm::LogBase

namespace pianm {

/**
 * @brief The logging interface, simple, logs a string
 */
struct LogBase : RC<thread_safe_refcount>
{
    typedef RCPtr<LogBase> Ptr;

    virtual void log(const std::string &str) = 0;
};

} // namespace pianm

#include <pianm/log/logthread.hpp>

#endif
