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
#include <pianm/libnm/variant.hpp>
#include <pianm/nm/profile.hpp>

using namespace pianm;
using namespace pianm::libnm;

namespace {

VariantPtr parse_variant(const char *type, const char *text)
{
    GError *err = nullptr;
    GVariant *v = g_variant_parse(G_VARIANT_TYPE(type), text, nullptr, nullptr, &err);
    if (!v)
    {
        const std::string msg = err ? err->message : "parse failed";
        g_clear_error(&err);
        throw Exception(msg);
    }
    return sink(v);
}

std::string type_of(GVariant *dict, const char *section, const char *key)
{
    VariantPtr sec(g_variant_lookup_value(dict, section, G_VARIANT_TYPE("a{sv}")));
    if (!sec)
        return std::string();
    VariantPtr v(g_variant_lookup_value(sec.get(), key, nullptr));
    return v ? g_variant_get_type_string(v.get()) : std::string();
}

} // namespace

TEST(Variant, ToJson)
{
    VariantPtr v = parse_variant("a{sa{sv}}",
                                 "{'connection': {'id': <'PIA-US-East'>, 'autoconnect': <false>},"
                                 " 'wireguard': {'fwmark': <uint32 51820>,"
                                 "  'peers': <[{'endpoint': <'1.2.3.4:1337'>, 'allowed-ips': <['0.0.0.0/0']>}]>},"
                                 " 'ipv4': {'route-metric': <int64 50>, 'dns-priority': <-1500>}}");
    const SettingsMap s = VariantConv::settings_from_variant(v.get());

    EXPECT_EQ(s["connection"]["id"].asString(), "PIA-US-East");
    EXPECT_FALSE(s["connection"]["autoconnect"].asBool());
    EXPECT_EQ(s["wireguard"]["fwmark"].asUInt(), 51820u);
    EXPECT_EQ(s["wireguard"]["peers"][0]["endpoint"].asString(), "1.2.3.4:1337");
    EXPECT_EQ(s["wireguard"]["peers"][0]["allowed-ips"][0].asString(), "0.0.0.0/0");
    EXPECT_EQ(s["ipv4"]["route-metric"].asInt64(), 50);
    EXPECT_EQ(s["ipv4"]["dns-priority"].asInt(), -1500);
}

TEST(Variant, NotAConnectionDictionary)
{
    VariantPtr v = parse_variant("a{sv}", "{'id': <'x'>}");
    EXPECT_THROW(VariantConv::settings_from_variant(v.get()), VariantConv::variant_error);
}

TEST(Variant, TemplateTypesWin)
{
    VariantPtr templ = parse_variant("a{sa{sv}}", "{'wireguard': {'fwmark': <uint32 0>, 'private-key': <'old'>}}");

    SettingsMap s(Json::objectValue);
    s["wireguard"]["fwmark"] = 7;
    s["wireguard"]["private-key"] = "new";
    s["wireguard"]["mtu"] = 1420;

    VariantPtr v = VariantConv::settings_to_variant(s, templ.get());
    EXPECT_EQ(type_of(v.get(), "wireguard", "fwmark"), "u");
    EXPECT_EQ(type_of(v.get(), "wireguard", "private-key"), "s");
    EXPECT_EQ(type_of(v.get(), "wireguard", "mtu"), "u");
}

TEST(Variant, ProfileSettingsBuild)
{
    WireGuardProfile p;
    p.connection_name = "PIA-US-East";
    p.interface_name = interface_name_for(p.connection_name);
    p.private_key = "k";
    p.server_pubkey = "s";
    p.server_endpoint = "1.2.3.4:1337";
    p.peer_ip = "10.20.30.40";
    p.dns_servers = {"10.0.0.243"};
    p.permission_user = "alice";
    const SettingsMap s = p.to_settings(generate_uuid());

    VariantPtr v = VariantConv::settings_to_variant(s, nullptr);
    EXPECT_EQ(type_of(v.get(), "connection", "permissions"), "as");
    EXPECT_EQ(type_of(v.get(), "wireguard", "peers"), "aa{sv}");
    EXPECT_EQ(type_of(v.get(), "ipv4", "address-data"), "aa{sv}");
    EXPECT_EQ(type_of(v.get(), "ipv4", "route-metric"), "x");
    EXPECT_EQ(type_of(v.get(), "ipv4", "dns-priority"), "i");

    // without a template that knows dns-data, servers go out as ipv4.dns
    EXPECT_EQ(type_of(v.get(), "ipv4", "dns"), "au");
    EXPECT_TRUE(type_of(v.get(), "ipv4", "dns-data").empty());

    const SettingsMap back = VariantConv::settings_from_variant(v.get());
    EXPECT_EQ(back["wireguard"], s["wireguard"]);
    EXPECT_EQ(back["connection"]["id"], s["connection"]["id"]);
}

TEST(Variant, DnsDataKeptWhenTemplateHasIt)
{
    VariantPtr templ = parse_variant("a{sa{sv}}", "{'ipv4': {'dns-data': <['10.0.0.1']>}}");
    SettingsMap s(Json::objectValue);
    s["ipv4"]["dns-data"].append("10.0.0.243");

    VariantPtr v = VariantConv::settings_to_variant(s, templ.get());
    EXPECT_EQ(type_of(v.get(), "ipv4", "dns-data"), "as");
    EXPECT_TRUE(type_of(v.get(), "ipv4", "dns").empty());
}

TEST(Variant, BadValues)
{
    SettingsMap s(Json::objectValue);
    s["wireguard"]["fwmark"] = "not a number";
    EXPECT_THROW(VariantConv::settings_to_variant(s, nullptr), VariantConv::variant_error);

    SettingsMap dns(Json::objectValue);
    dns["ipv4"]["dns-data"].append("not-an-address");
    EXPECT_THROW(VariantConv::settings_to_variant(dns, nullptr), VariantConv::variant_error);

    SettingsMap flat(Json::objectValue);
    flat["wireguard"] = "scalar";
    EXPECT_THROW(VariantConv::settings_to_variant(flat, nullptr), VariantConv::variant_error);
}
