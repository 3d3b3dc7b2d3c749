//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

#ifndef PIANM_NM_WGUPDATE_H
#define PIANM_NM_WGUPDATE_H

#include <string>

#include <pianm/log/logger.hpp>
#include <pianm/nm/nmerr.hpp>
#include <pianm/nm/settings.hpp>

namespace pianm {

class WgUpdate : public logging::CoreLogging
{
  public:
    /**
     * Derives the settings for a credential rotation.
     *
     * Returns a deep copy of settings in which only
     * wireguard.private-key and the endpoint of the first peer differ.
     * settings itself is left untouched.  A missing or empty peer list
     * only costs the endpoint change: it is logged, and reported through
     * endpoint_applied when given.
     *
     * @throws missing_config_section if settings has no wireguard section
     */
    static SettingsMap apply_credential_change(const SettingsMap &settings,
                                               const std::string &private_key,
                                               const std::string &peer_endpoint,
                                               bool *endpoint_applied = nullptr)
    {
        if (!settings.isObject() || !settings[Setting::WIREGUARD].isObject())
            throw missing_config_section("settings have no wireguard section");

        SettingsMap ret = settings;
        SettingsMap &wg = ret[Setting::WIREGUARD];
        wg[Setting::WG_PRIVATE_KEY] = private_key;

        SettingsMap &peers = wg[Setting::WG_PEERS];
        const bool has_peer = peers.isArray() && !peers.empty() && peers[0].isObject();
        if (endpoint_applied)
            *endpoint_applied = has_peer;
        if (has_peer)
            peers[0][Setting::WG_PEER_ENDPOINT] = peer_endpoint;
        else
        {
            // indexing a missing member above added a null one
            if (peers.isNull())
                wg.removeMember(Setting::WG_PEERS);
            LOG_INFO("WARNING: wireguard settings have no peer, endpoint " << peer_endpoint << " not applied");
        }
        return ret;
    }
};

} // namespace pianm

#endif
