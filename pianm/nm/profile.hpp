//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Building the settings of a new WireGuard connection.

#ifndef PIANM_NM_PROFILE_H
#define PIANM_NM_PROFILE_H

#include <unistd.h>
#include <pwd.h>
#include <sys/types.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <pianm/common/exception.hpp>
#include <pianm/common/jsonhelper.hpp>
#include <pianm/log/logger.hpp>
#include <pianm/nm/nmerr.hpp>
#include <pianm/nm/settings.hpp>

namespace pianm {

// Connection ids are limited to 32 characters: "PIA-" plus at most
// 28 characters of region name, spaces replaced by dashes.
inline std::string format_profile_name(const std::string &region_name)
{
    std::string clean = region_name;
    for (auto &c : clean)
        if (c == ' ')
            c = '-';
    if (clean.length() > 28)
        clean.resize(28);
    return "PIA-" + clean;
}

// "wg-" and the first 8 hex digits of the MD5 of the profile name,
// short enough for a kernel interface name.
inline std::string interface_name_for(const std::string &profile_name)
{
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (!EVP_Digest(profile_name.data(), profile_name.length(), md, &md_len, EVP_md5(), nullptr))
        throw Exception("interface_name_for: MD5 digest failed");

    static const char hex[] = "0123456789abcdef";
    std::string ret = "wg-";
    for (unsigned int i = 0; i < 4; ++i)
    {
        ret += hex[md[i] >> 4];
        ret += hex[md[i] & 0x0f];
    }
    return ret;
}

// Random RFC 4122 version 4 UUID.
inline std::string generate_uuid()
{
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1)
        throw Exception("generate_uuid: RAND_bytes failed");
    b[6] = (b[6] & 0x0f) | 0x40;
    b[8] = (b[8] & 0x3f) | 0x80;

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf);
}

// Name of the effective user, or empty if the password database does
// not know it.
inline std::string current_username()
{
    struct passwd pwd;
    struct passwd *result = nullptr;
    long bufsize = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufsize <= 0)
        bufsize = 16384;
    std::unique_ptr<char[]> buf(new char[bufsize]);
    if (::getpwuid_r(::geteuid(), &pwd, buf.get(), bufsize, &result) != 0 || !result)
        return std::string();
    return std::string(pwd.pw_name);
}

struct WireGuardProfile : public logging::CoreLogging
{
    std::string connection_name;
    std::string interface_name;
    std::string private_key;
    std::string server_pubkey;
    std::string server_endpoint; // "ip:port"
    std::string peer_ip;         // address assigned to this client
    std::vector<std::string> dns_servers;
    std::string allowed_ips = "0.0.0.0/0";
    unsigned int persistent_keepalive = 25;
    unsigned int fwmark = 0;
    bool use_vpn_dns = true;
    bool ipv6_enabled = false;
    std::string permission_user; // may modify the connection; empty for system-wide

    /**
     * Reads a profile description.  The connection name is taken from
     * "name", or derived from "region"; the interface name defaults to
     * one derived from the connection name.
     */
    static WireGuardProfile from_json(const Json::Value &root, const std::string &title)
    {
        json::assert_dict(root, title);

        WireGuardProfile p;
        if (json::exists(root, "name"))
            p.connection_name = json::get_string(root, "name", title);
        else
            p.connection_name = format_profile_name(json::get_string(root, "region", title));
        p.interface_name = json::get_string_optional(root, "interface_name", interface_name_for(p.connection_name), title);
        p.private_key = json::get_string(root, "private_key", title);
        p.server_pubkey = json::get_string(root, "server_pubkey", title);
        p.server_endpoint = json::get_string(root, "server_endpoint", title);
        p.peer_ip = json::get_string(root, "peer_ip", title);

        const Json::Value &dns = json::get_array(root, "dns_servers", false, title);
        for (Json::ArrayIndex i = 0; i < dns.size(); ++i)
        {
            if (!dns[i].isString())
                throw json::json_parse("string " + title + ".dns_servers[" + std::to_string(i) + "] is of incorrect type");
            p.dns_servers.push_back(dns[i].asString());
        }

        p.allowed_ips = json::get_string_optional(root, "allowed_ips", p.allowed_ips, title);
        p.persistent_keepalive = json::get_uint_optional(root, "persistent_keepalive", p.persistent_keepalive, title);
        p.fwmark = json::get_uint_optional(root, "fwmark", p.fwmark, title);
        p.use_vpn_dns = json::get_bool_optional(root, "use_vpn_dns", p.use_vpn_dns, title);
        p.ipv6_enabled = json::get_bool_optional(root, "ipv6_enabled", p.ipv6_enabled, title);
        p.permission_user = json::get_string_optional(root, "permission_user", current_username(), title);
        return p;
    }

    // @throws profile_invalid naming the first offending field
    void validate() const
    {
        if (connection_name.empty())
            throw profile_invalid("connection_name cannot be empty");
        if (interface_name.empty())
            throw profile_invalid("interface_name cannot be empty");
        if (interface_name.length() > 15)
            PIANM_THROW(profile_invalid, "interface_name too long: " << interface_name.length() << " chars (max 15): " << interface_name);
        if (private_key.empty())
            throw profile_invalid("private_key cannot be empty");
        if (server_pubkey.empty())
            throw profile_invalid("server_pubkey cannot be empty");
        if (server_endpoint.empty())
            throw profile_invalid("server_endpoint cannot be empty");
        if (server_endpoint.find(':') == std::string::npos)
            throw profile_invalid("server_endpoint must be in 'ip:port' format: " + server_endpoint);
        if (peer_ip.empty())
            throw profile_invalid("peer_ip cannot be empty");
        if (dns_servers.empty())
            throw profile_invalid("dns_servers cannot be empty");
    }

    // The connection descriptor handed to Service::add_connection_async().
    SettingsMap to_settings(const std::string &uuid) const
    {
        validate();

        SettingsMap s(Json::objectValue);

        SettingsMap &conn = s[Setting::CONNECTION];
        conn["id"] = connection_name;
        conn["uuid"] = uuid;
        conn["type"] = Setting::WIREGUARD;
        conn["interface-name"] = interface_name;
        conn["autoconnect"] = false;
        if (!permission_user.empty())
        {
            conn["permissions"] = Json::Value(Json::arrayValue);
            conn["permissions"].append("user:" + permission_user + ":");
        }
        else
            LOG_INFO("WARNING: " << connection_name << " has no owner, it will be system-wide and may need root to modify");

        SettingsMap &wg = s[Setting::WIREGUARD];
        wg[Setting::WG_PRIVATE_KEY] = private_key;
        wg["fwmark"] = fwmark;
        Json::Value peer(Json::objectValue);
        peer[Setting::WG_PEER_PUBLIC_KEY] = server_pubkey;
        peer[Setting::WG_PEER_ENDPOINT] = server_endpoint;
        peer["allowed-ips"] = Json::Value(Json::arrayValue);
        peer["allowed-ips"].append(allowed_ips);
        if (persistent_keepalive > 0)
            peer["persistent-keepalive"] = persistent_keepalive;
        wg[Setting::WG_PEERS] = Json::Value(Json::arrayValue);
        wg[Setting::WG_PEERS].append(peer);

        SettingsMap &ipv4 = s[Setting::IPV4];
        ipv4["method"] = "manual";
        Json::Value addr(Json::objectValue);
        addr["address"] = peer_ip;
        addr["prefix"] = 32u;
        ipv4["address-data"] = Json::Value(Json::arrayValue);
        ipv4["address-data"].append(addr);
        ipv4["gateway"] = "0.0.0.0";
        ipv4["route-metric"] = 50;
        if (use_vpn_dns)
        {
            ipv4["dns-priority"] = -1500;
            ipv4["ignore-auto-dns"] = true;
            ipv4["dns-data"] = Json::Value(Json::arrayValue);
            for (const auto &d : dns_servers)
                ipv4["dns-data"].append(d);
            ipv4["dns-search"] = Json::Value(Json::arrayValue);
            ipv4["dns-search"].append("~");
        }

        SettingsMap &ipv6 = s[Setting::IPV6];
        ipv6["method"] = ipv6_enabled ? "manual" : "disabled";

        LOG_DEBUG("profile " << connection_name << ": " << interface_name << " -> " << server_endpoint);
        return s;
    }
};

} // namespace pianm

#endif
