//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Connection settings as exchanged with the configuration service.
//
// A SettingsMap is a JSON object of sections ("connection",
// "wireguard", "ipv4", ...), each a JSON object of keys.  WireGuard
// peers live in wireguard.peers, an array of objects.  Json::Value
// copies deeply and compares structurally.

#ifndef PIANM_NM_SETTINGS_H
#define PIANM_NM_SETTINGS_H

#include <cstdint>
#include <string>

#include <json/json.h>

namespace pianm {

typedef Json::Value SettingsMap;

namespace Setting {
constexpr char CONNECTION[] = "connection";
constexpr char WIREGUARD[] = "wireguard";
constexpr char IPV4[] = "ipv4";
constexpr char IPV6[] = "ipv6";

constexpr char WG_PRIVATE_KEY[] = "private-key";
constexpr char WG_PEERS[] = "peers";
constexpr char WG_PEER_ENDPOINT[] = "endpoint";
constexpr char WG_PEER_PUBLIC_KEY[] = "public-key";
} // namespace Setting

// The configuration currently enforced on a device, and the token a
// reapply must present to be accepted.
struct AppliedSnapshot
{
    SettingsMap settings;
    std::uint64_t version_id = 0;
};

// Copy of settings fit for display: private keys are replaced by a
// fixed marker.
inline SettingsMap mask_secrets(const SettingsMap &settings)
{
    SettingsMap ret = settings;
    if (!ret.isObject() || !ret.isMember(Setting::WIREGUARD))
        return ret;
    SettingsMap &wg = ret[Setting::WIREGUARD];
    if (wg.isObject() && wg.isMember(Setting::WG_PRIVATE_KEY))
        wg[Setting::WG_PRIVATE_KEY] = "<hidden>";
    return ret;
}

} // namespace pianm

#endif
