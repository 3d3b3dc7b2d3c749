//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

#ifndef PIANM_LOG_LOGGER_H
#define PIANM_LOG_LOGGER_H

#include <algorithm>
#include <sstream>
#include <string>
#include <type_traits>

#include <pianm/log/logbase.hpp>

namespace pianm {
namespace logging {

/** log message level with the highest priority. Critical messages that should always be shown are in this category */
constexpr int LOG_LEVEL_ERROR = 0;
/** log message level with high/normal priority. These are messages that are shown in normal operation */
constexpr int LOG_LEVEL_INFO = 1;
/** log message with verbose priority. These are still part of normal operation when higher logging verbosity is
 requested */
constexpr int LOG_LEVEL_VERB = 2;
/** debug log message priority. Only messages that are useful for a debugging a feature should fall into this
 * category */
constexpr int LOG_LEVEL_DEBUG = 3;
/** trace log message priority. Individual service calls and callback invocations belong here. */
constexpr int LOG_LEVEL_TRACE = 4;

/**
 * Parses a level name as used in the configuration file.
 * @return the level, or -1 if the name is unknown
 */
inline int parse_log_level(const std::string &name)
{
    if (name == "error")
        return LOG_LEVEL_ERROR;
    else if (name == "info")
        return LOG_LEVEL_INFO;
    else if (name == "verbose")
        return LOG_LEVEL_VERB;
    else if (name == "debug")
        return LOG_LEVEL_DEBUG;
    else if (name == "trace")
        return LOG_LEVEL_TRACE;
    else
        return -1;
}

/**
 * A class that simplifies the logging with different verbosity. It is
 * intended to be either used as a base class or preferably as a member.
 *
 * @tparam DEFAULT_LOG_LEVEL      the default loglevel for this class
 * @tparam MAX_LEVEL            the maximum loglevel that will be printed. Logging with higher
 *                              verbosity will be disabled by using if constexpr expressions.
 */
template <int DEFAULT_LOG_LEVEL, int MAX_LEVEL = LOG_LEVEL_DEBUG>
class Logger
{
  public:
    static constexpr int max_log_level = std::max(MAX_LEVEL, DEFAULT_LOG_LEVEL);
    static constexpr int default_log_level = DEFAULT_LOG_LEVEL;

    //! return the current logging level for all logging
    int log_level() const
    {
        return current_log_level;
    }

    //! set the log level for all logging
    void set_log_level(int level)
    {
        current_log_level = level;
    }

    template <typename T>
    void log_trace(T &&msg)
    {
        if constexpr (max_log_level >= LOG_LEVEL_TRACE)
        {
            if (current_log_level >= LOG_LEVEL_TRACE)
                PIANM_LOG(msg);
        }
    }

    template <typename T>
    void log_debug(T &&msg)
    {
        if constexpr (max_log_level >= LOG_LEVEL_DEBUG)
        {
            if (current_log_level >= LOG_LEVEL_DEBUG)
                PIANM_LOG(msg);
        }
    }

    template <typename T>
    void log_info(T &&msg)
    {
        if constexpr (max_log_level >= LOG_LEVEL_INFO)
        {
            if (current_log_level >= LOG_LEVEL_INFO)
                PIANM_LOG(msg);
        }
    }

    template <typename T>
    void log_verbose(T &&msg)
    {
        if constexpr (max_log_level >= LOG_LEVEL_VERB)
        {
            if (current_log_level >= LOG_LEVEL_VERB)
                PIANM_LOG(msg);
        }
    }

    /**
     * Logs an error message that should almost always be logged
     * @param msg   the message to log
     */
    template <typename T>
    void log_error(T &&msg)
    {
        if (current_log_level >= LOG_LEVEL_ERROR)
            PIANM_LOG(msg);
    }

  protected:
    //! configured loglevel
    int current_log_level = DEFAULT_LOG_LEVEL;
};

/**
 * A mixin class that can be used as base class to expose the setting and getting of the log level publicly but not expose
 * the log methods themselves. Class parameters are the same as for \class Logger
 */
template <int DEFAULT_LOG_LEVEL, int MAX_LEVEL = LOG_LEVEL_TRACE>
class LoggingMixin
{
  public:
    //! return the current logging level for all logging
    static int log_level()
    {
        return log_.log_level();
    }

    //! set the log level for all logging
    static void set_log_level(int level)
    {
        log_.set_log_level(level);
    }

    static constexpr int max_log_level = logging::Logger<DEFAULT_LOG_LEVEL, MAX_LEVEL>::max_log_level;
    static constexpr int default_log_level = logging::Logger<DEFAULT_LOG_LEVEL, MAX_LEVEL>::default_log_level;

  protected:
    static inline logging::Logger<DEFAULT_LOG_LEVEL, MAX_LEVEL> log_;
};

#define PIANM_LOGGER_LOG(logger, level, method, args)                    \
    do                                                                   \
    {                                                                    \
        if constexpr (std::decay_t<decltype(logger)>::max_log_level >= level) \
        {                                                                \
            if (logger.log_level() >= level)                             \
            {                                                            \
                std::ostringstream _pianm_log_ss;                        \
                _pianm_log_ss << args;                                   \
                logger.method(_pianm_log_ss.str());                      \
            }                                                            \
        }                                                                \
    } while (0)

/* Log helper macros that do not build the message when it would not be
 * logged.  They expect a logger member named log_ in scope. */
#define LOG_ERROR(args) PIANM_LOGGER_LOG(log_, pianm::logging::LOG_LEVEL_ERROR, log_error, args)
#define LOG_INFO(args) PIANM_LOGGER_LOG(log_, pianm::logging::LOG_LEVEL_INFO, log_info, args)
#define LOG_VERBOSE(args) PIANM_LOGGER_LOG(log_, pianm::logging::LOG_LEVEL_VERB, log_verbose, args)
#define LOG_DEBUG(args) PIANM_LOGGER_LOG(log_, pianm::logging::LOG_LEVEL_DEBUG, log_debug, args)
#define LOG_TRACE(args) PIANM_LOGGER_LOG(log_, pianm::logging::LOG_LEVEL_TRACE, log_trace, args)

/**
 * Verbosity shared by every component of the connection core, so a
 * single setting from the configuration file or the command line
 * controls all of them.
 */
typedef LoggingMixin<LOG_LEVEL_INFO, LOG_LEVEL_TRACE> CoreLogging;

} // namespace logging
} // namespace pianm

#endif
