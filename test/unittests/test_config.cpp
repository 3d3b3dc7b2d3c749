//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

#include "test_common.hpp"

#include <string>

#include <pianm/common/jsonhelper.hpp>
#include <pianm/nm/config.hpp>

using namespace pianm;

TEST(Config, Defaults)
{
    const CoreConfig c = CoreConfig::from_json(Json::Value(Json::objectValue), "config");
    EXPECT_EQ(c.operation_timeout.count(), 30000);
    EXPECT_EQ(c.reapply_attempts, 3u);
    EXPECT_EQ(c.log_level, logging::LOG_LEVEL_INFO);
    EXPECT_TRUE(c.log_file.empty());
    EXPECT_EQ(c.glib_pump_interval.count(), 5);
}

TEST(Config, AllKeys)
{
    const CoreConfig c = CoreConfig::from_json(json::parse(R"({
        "operation_timeout_ms": 5000,
        "reapply_attempts": 5,
        "log_level": "debug",
        "log_file": "/var/log/pia-nm.log",
        "glib_pump_interval_ms": 10,
        "unknown": true
    })",
                                                           "config"),
                                               "config");
    EXPECT_EQ(c.operation_timeout.count(), 5000);
    EXPECT_EQ(c.reapply_attempts, 5u);
    EXPECT_EQ(c.log_level, logging::LOG_LEVEL_DEBUG);
    EXPECT_EQ(c.log_file, "/var/log/pia-nm.log");
    EXPECT_EQ(c.glib_pump_interval.count(), 10);
}

TEST(Config, BadValues)
{
    EXPECT_THROW(CoreConfig::from_json(json::parse(R"({"operation_timeout_ms": 0})", "c"), "c"), config_error);
    EXPECT_THROW(CoreConfig::from_json(json::parse(R"({"reapply_attempts": 0})", "c"), "c"), config_error);
    EXPECT_THROW(CoreConfig::from_json(json::parse(R"({"log_level": "loud"})", "c"), "c"), config_error);
    EXPECT_THROW(CoreConfig::from_json(json::parse(R"({"log_level": 3})", "c"), "c"), config_error);
    EXPECT_THROW(CoreConfig::from_json(json::parse(R"({"reapply_attempts": "three"})", "c"), "c"), config_error);
    EXPECT_THROW(CoreConfig::from_json(json::parse("[1, 2]", "c"), "c"), config_error);
}

TEST(Config, ErrorIsFatal)
{
    try
    {
        CoreConfig::from_json(json::parse(R"({"glib_pump_interval_ms": 0})", "c"), "c");
        FAIL() << "config_error expected";
    }
    catch (const config_error &e)
    {
        EXPECT_EQ(e.code(), Error::CONFIG_ERROR);
        EXPECT_TRUE(e.fatal());
    }
}

TEST(Config, MissingFile)
{
    EXPECT_THROW(CoreConfig::from_file("/nonexistent/pia-nm/config.json"), config_error);
}
