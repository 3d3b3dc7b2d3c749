//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Production log sink: timestamped, redacted lines on stderr and,
// optionally, appended to a log file.

#ifndef PIANM_LOG_LOGSINK_H
#define PIANM_LOG_LOGSINK_H

#include <time.h>
#include <sys/time.h>
#include <stdio.h>

#include <string>
#include <fstream>
#include <iostream>
#include <mutex>

#include <pianm/common/exception.hpp>
#include <pianm/log/logbase.hpp>
#include <pianm/log/logredact.hpp>

namespace pianm {

// 2024-05-01 13:37:00.123
inline std::string date_time()
{
    struct timeval tv;
    if (::gettimeofday(&tv, nullptr) < 0)
    {
        tv.tv_sec = 0;
        tv.tv_usec = 0;
    }
    struct tm lt;
    char buf[64];
    if (!localtime_r(&tv.tv_sec, &lt))
        return "LOCALTIME_ERROR";
    const size_t len = ::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt);
    ::snprintf(buf + len, sizeof(buf) - len, ".%03u", static_cast<unsigned int>(tv.tv_usec / 1000));
    return std::string(buf);
}

class LogSinkStd : public LogBase
{
  public:
    typedef RCPtr<LogSinkStd> Ptr;

    PIANM_EXCEPTION(log_file_error);

    LogSinkStd()
        : log_context(this)
    {
    }

    // Also append every line to fn.  Throws log_file_error if the
    // file cannot be opened for appending.
    void open_file(const std::string &fn)
    {
        std::lock_guard<std::mutex> lock(mutex);
        file.open(fn, std::ios::out | std::ios::app);
        if (!file)
            PIANM_THROW(log_file_error, "cannot open " << fn << " for appending");
    }

    void log(const std::string &str) override
    {
        const std::string line = date_time() + ' ' + LogRedact::redact(str);
        std::lock_guard<std::mutex> lock(mutex);
        std::cerr << line;
        if (file.is_open())
        {
            file << line;
            file.flush();
        }
    }

  private:
    std::mutex mutex;
    std::ofstream file;
    Log::Context log_context;
};

} // namespace pianm

#endif
