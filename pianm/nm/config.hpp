//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Runtime settings of the connection core, read from a JSON file.

#ifndef PIANM_NM_CONFIG_H
#define PIANM_NM_CONFIG_H

#include <chrono>
#include <string>

#include <pianm/common/jsonhelper.hpp>
#include <pianm/log/logger.hpp>
#include <pianm/nm/nmerr.hpp>

namespace pianm {

struct CoreConfig
{
    std::chrono::milliseconds operation_timeout{30000};
    unsigned int reapply_attempts = 3;
    int log_level = logging::LOG_LEVEL_INFO;
    std::string log_file;
    std::chrono::milliseconds glib_pump_interval{5};

    // Every key is optional; unknown keys are ignored.
    // @throws config_error on a key of the wrong type or value
    static CoreConfig from_json(const Json::Value &root, const std::string &title)
    {
        CoreConfig c;
        try
        {
            json::assert_dict(root, title);

            c.operation_timeout = std::chrono::milliseconds(
                json::get_uint_optional(root, "operation_timeout_ms", static_cast<unsigned int>(c.operation_timeout.count()), title));
            if (c.operation_timeout.count() == 0)
                throw config_error(title + ".operation_timeout_ms must be positive");

            c.reapply_attempts = json::get_uint_optional(root, "reapply_attempts", c.reapply_attempts, title);
            if (c.reapply_attempts < 1)
                throw config_error(title + ".reapply_attempts must be at least 1");

            const std::string level = json::get_string_optional(root, "log_level", "info", title);
            c.log_level = logging::parse_log_level(level);
            if (c.log_level < 0)
                throw config_error(title + ".log_level: unknown level '" + level + "'");

            c.log_file = json::get_string_optional(root, "log_file", c.log_file, title);

            c.glib_pump_interval = std::chrono::milliseconds(
                json::get_uint_optional(root, "glib_pump_interval_ms", static_cast<unsigned int>(c.glib_pump_interval.count()), title));
            if (c.glib_pump_interval.count() == 0)
                throw config_error(title + ".glib_pump_interval_ms must be at least 1");
        }
        catch (const json::json_parse &e)
        {
            throw config_error(e.what());
        }
        return c;
    }

    // @throws config_error if the file is missing or malformed
    static CoreConfig from_file(const std::string &fn)
    {
        Json::Value root;
        try
        {
            root = json::parse_from_file(fn);
        }
        catch (const std::exception &e)
        {
            throw config_error(e.what());
        }
        return from_json(root, fn);
    }
};

} // namespace pianm

#endif
