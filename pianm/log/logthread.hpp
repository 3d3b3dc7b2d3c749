//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// General-purpose logging framework: PIANM_LOG and PIANM_LOG_STRING
// dispatch to a thread-local handler installed by Log::Context.

#ifndef PIANM_LOG_LOGTHREAD_H
#define PIANM_LOG_LOGTHREAD_H

#include <sstream>

// Define this parameter before including this header:
// PIANM_LOG_CLASS -- client class that exposes a log() method
#ifndef PIANM_LOG_CLASS
#error PIANM_LOG_CLASS must be defined
#endif

#define PIANM_LOG(args)                                           \
    do                                                            \
    {                                                             \
        if (pianm::Log::Context::defined())                       \
        {                                                         \
            std::ostringstream _pianm_log_ss;                     \
            _pianm_log_ss << args << '\n';                        \
            pianm::Log::Context::obj()->log(_pianm_log_ss.str()); \
        }                                                         \
    } while (0)

#define PIANM_LOG_STRING(str)                       \
    do                                              \
    {                                               \
        if (pianm::Log::Context::defined())         \
            pianm::Log::Context::obj()->log(str);   \
    } while (0)

namespace pianm {
namespace Log {

// PIANM_LOG uses thread-local object pointer
inline thread_local PIANM_LOG_CLASS *global_log = nullptr; // GLOBAL

struct Context
{
    // Mechanism for passing thread-local global_log to another thread.
    class Wrapper
    {
      public:
        Wrapper()
            : log(obj())
        {
        }

      private:
        friend struct Context;
        PIANM_LOG_CLASS *log;
    };

    // While in scope, turns on global_log for this thread.
    Context(const Wrapper &wrap)
    {
        global_log = wrap.log;
    }

    Context(PIANM_LOG_CLASS *cli)
    {
        global_log = cli;
    }

    ~Context()
    {
        global_log = nullptr;
    }

    static bool defined()
    {
        return global_log != nullptr;
    }

    static PIANM_LOG_CLASS *obj()
    {
        return global_log;
    }
};

} // namespace Log
} // namespace pianm

#endif
