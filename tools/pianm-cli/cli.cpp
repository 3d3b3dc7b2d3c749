//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// pia-nm command line client

#include <getopt.h>
#include <stdlib.h> // for atoi

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <pianm/common/exception.hpp>
#include <pianm/common/jsonhelper.hpp>
#include <pianm/log/logsink.hpp>
#include <pianm/log/logger.hpp>
#include <pianm/nm/client.hpp>
#include <pianm/nm/config.hpp>
#include <pianm/nm/loop.hpp>
#include <pianm/nm/profile.hpp>
#include <pianm/nm/refresh.hpp>
#include <pianm/libnm/libnmservice.hpp>

using namespace pianm;

namespace {

PIANM_SIMPLE_EXCEPTION(usage);

int cmd_list(ConnectionClient &client)
{
    for (const auto &conn : client.list())
    {
        const bool active = bool(client.get_active(conn));
        std::cout << conn.id << "  " << conn.uuid << (active ? "  [active]" : "") << std::endl;
    }
    return 0;
}

int cmd_show(ConnectionClient &client, const std::string &id)
{
    const ConnectionRef conn = client.get_by_id(id);
    if (!conn)
    {
        std::cerr << "no connection named " << id << std::endl;
        return 1;
    }

    SettingsMap settings;
    if (client.get_active(conn))
    {
        const DeviceRef device = client.device_for(conn);
        const std::optional<AppliedSnapshot> snap = client.get_applied_connection(device);
        if (!snap)
        {
            std::cerr << id << ": cannot read applied connection" << std::endl;
            return 1;
        }
        std::cout << "# applied on " << device.iface << ", version " << snap->version_id << std::endl;
        settings = snap->settings;
    }
    else
    {
        const std::optional<SettingsMap> saved = client.get_saved_settings(conn);
        if (!saved)
        {
            std::cerr << id << ": cannot read saved settings" << std::endl;
            return 1;
        }
        std::cout << "# saved profile (inactive)" << std::endl;
        settings = *saved;
    }
    std::cout << json::format(mask_secrets(settings));
    return 0;
}

int cmd_add(ConnectionClient &client, const std::string &fn)
{
    const WireGuardProfile profile = WireGuardProfile::from_json(json::parse_from_file(fn), fn);
    if (client.get_by_id(profile.connection_name))
    {
        std::cerr << profile.connection_name << " already exists" << std::endl;
        return 1;
    }
    const ConnectionRef conn = client.add(profile.to_settings(generate_uuid())).await(client.timeout());
    std::cout << conn.id << "  " << conn.uuid << std::endl;
    return 0;
}

int cmd_activate(ConnectionClient &client, const std::string &id)
{
    const ConnectionRef conn = client.get_by_id(id);
    if (!conn)
    {
        std::cerr << "no connection named " << id << std::endl;
        return 1;
    }
    const ActiveConnectionRef ac = client.activate(conn).await(client.timeout());
    std::cout << "activated " << ac.connection.id << std::endl;
    return 0;
}

int cmd_remove(ConnectionClient &client, const std::string &id)
{
    const ConnectionRef conn = client.get_by_id(id);
    if (!conn)
    {
        std::cerr << "no connection named " << id << std::endl;
        return 1;
    }
    client.remove(conn).await(client.timeout());
    std::cout << "removed " << id << std::endl;
    return 0;
}

int cmd_refresh(ConnectionClient &client, const CoreConfig &config, const std::string &fn)
{
    const std::vector<RefreshRequest> requests = RefreshRequest::list_from_json(json::parse_from_file(fn), fn);
    RefreshEngine engine(client, config.reapply_attempts);
    const RefreshSummary summary = engine.refresh_all(requests);

    for (const auto &r : summary.results)
    {
        if (r.ok())
        {
            std::cout << "OK    " << r.resource_id << (r.live ? " (live, no disconnection)" : " (saved profile)") << std::endl;
            if (!r.endpoint_applied)
                std::cout << "      " << r.message << std::endl;
        }
        else
            std::cout << "FAIL  " << r.resource_id << " " << Error::name(r.error) << ": " << r.message << std::endl;
    }
    std::cout << summary.successful << " updated (" << summary.live << " live), " << summary.failed << " failed" << std::endl;
    return summary.ok() ? 0 : 1;
}

int pianm_cli(int argc, char *argv[])
{
    static const struct option longopts[] = {
        // clang-format off
        { "config",  required_argument, nullptr, 'c' },
        { "timeout", required_argument, nullptr, 't' },
        { "verbose", no_argument,       nullptr, 'v' },
        { "help",    no_argument,       nullptr, 'h' },
        { nullptr,   0,                 nullptr,  0  }
        // clang-format on
    };

    int ret = 0;
    try
    {
        std::string config_fn;
        int timeout_ms = 0;
        int verbose = 0;

        int ch;
        optind = 1;
        while ((ch = getopt_long(argc, argv, "c:t:vh", longopts, nullptr)) != -1)
        {
            switch (ch)
            {
            case 'c':
                config_fn = optarg;
                break;
            case 't':
                timeout_ms = ::atoi(optarg);
                if (timeout_ms <= 0)
                    throw usage();
                break;
            case 'v':
                ++verbose;
                break;
            default:
                throw usage();
            }
        }
        argc -= optind;
        argv += optind;
        if (argc < 1)
            throw usage();

        const std::string cmd = argv[0];
        const std::vector<std::string> args(argv + 1, argv + argc);

        CoreConfig config;
        if (!config_fn.empty())
            config = CoreConfig::from_file(config_fn);
        if (timeout_ms)
            config.operation_timeout = std::chrono::milliseconds(timeout_ms);
        if (verbose)
            config.log_level = std::min(logging::LOG_LEVEL_INFO + verbose, logging::LOG_LEVEL_TRACE);

        LogSinkStd::Ptr log(new LogSinkStd());
        if (!config.log_file.empty())
            log->open_file(config.log_file);
        logging::CoreLogging::set_log_level(config.log_level);

        const bool known = (cmd == "list" && args.empty())
                           || ((cmd == "show" || cmd == "add" || cmd == "activate" || cmd == "remove" || cmd == "refresh")
                               && args.size() == 1);
        if (!known)
            throw usage();

        EventLoop::Ptr loop(new EventLoop(libnm::make_service_factory(config.glib_pump_interval)));
        ConnectionClient client(*loop, config.operation_timeout);

        if (cmd == "list")
            ret = cmd_list(client);
        else if (cmd == "show")
            ret = cmd_show(client, args[0]);
        else if (cmd == "add")
            ret = cmd_add(client, args[0]);
        else if (cmd == "activate")
            ret = cmd_activate(client, args[0]);
        else if (cmd == "remove")
            ret = cmd_remove(client, args[0]);
        else
            ret = cmd_refresh(client, config, args[0]);
    }
    catch (const usage &)
    {
        std::cout << "pia-nm command line client" << std::endl;
        std::cout << "usage: pianm-cli [options] <command> [args]" << std::endl;
        std::cout << "--config, -c FILE    : JSON configuration file" << std::endl;
        std::cout << "--timeout, -t MS     : timeout of each service operation" << std::endl;
        std::cout << "--verbose, -v        : more logging, repeat for more" << std::endl;
        std::cout << "commands:" << std::endl;
        std::cout << "  list                 : connections, with their uuid and state" << std::endl;
        std::cout << "  show ID              : applied or saved settings, keys hidden" << std::endl;
        std::cout << "  add PROFILE.json     : create a WireGuard connection" << std::endl;
        std::cout << "  activate ID          : bring a connection up" << std::endl;
        std::cout << "  remove ID            : delete a connection" << std::endl;
        std::cout << "  refresh TARGETS.json : rotate keys and endpoints, live where active" << std::endl;
        ret = 2;
    }
    return ret;
}

} // namespace

int main(int argc, char *argv[])
{
    int ret = 0;

    try
    {
        ret = pianm_cli(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "pianm-cli: " << e.what() << std::endl;
        ret = 1;
    }
    return ret;
}
