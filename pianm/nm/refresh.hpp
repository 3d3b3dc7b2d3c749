//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Credential rotation for WireGuard connections.
//
// An active connection is updated in place: its applied settings are
// read together with their version id, the new key and endpoint are
// patched in, and the result is reapplied to the device.  The tunnel
// never goes down.  An inactive connection gets its saved profile
// updated instead.  Neither path deletes or re-adds the connection.

#ifndef PIANM_NM_REFRESH_H
#define PIANM_NM_REFRESH_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <pianm/common/jsonhelper.hpp>
#include <pianm/error/error.hpp>
#include <pianm/log/logger.hpp>
#include <pianm/nm/client.hpp>
#include <pianm/nm/nmerr.hpp>
#include <pianm/nm/wgupdate.hpp>

namespace pianm {

struct RefreshRequest
{
    std::string resource_id; // connection id, e.g. "PIA-US-East"
    std::string private_key;
    std::string peer_endpoint; // "host:port"

    // [ { "id": ..., "private_key": ..., "endpoint": ... }, ... ]
    static std::vector<RefreshRequest> list_from_json(const Json::Value &root, const std::string &title)
    {
        if (!root.isArray())
            throw json::json_parse(title + " is not a JSON array");
        std::vector<RefreshRequest> ret;
        for (Json::ArrayIndex i = 0; i < root.size(); ++i)
        {
            const std::string t = title + '[' + std::to_string(i) + ']';
            json::assert_dict(root[i], t);
            RefreshRequest req;
            req.resource_id = json::get_string(root[i], "id", t);
            req.private_key = json::get_string(root[i], "private_key", t);
            req.peer_endpoint = json::get_string(root[i], "endpoint", t);
            ret.push_back(std::move(req));
        }
        return ret;
    }
};

struct RefreshStatus
{
    std::string resource_id;
    bool live = false; // updated in place, connectivity preserved
    Error::Type error = Error::SUCCESS;
    std::string message;
    unsigned int attempts = 0;
    bool endpoint_applied = false; // false when the settings had no peer to carry it

    bool ok() const
    {
        return error == Error::SUCCESS;
    }
};

struct RefreshSummary
{
    std::vector<RefreshStatus> results;
    unsigned int successful = 0;
    unsigned int failed = 0;
    unsigned int live = 0;

    bool ok() const
    {
        return failed == 0;
    }
};

class RefreshEngine : public logging::CoreLogging
{
  public:
    /**
     * @param client          facade used for every service call
     * @param reapply_attempts how many times the whole live sequence
     *                         (read applied state, patch, reapply) is
     *                         tried before REAPPLY_FAILED is reported.
     *                         Values below 1 count as 1.
     */
    RefreshEngine(ConnectionClient &client, const unsigned int reapply_attempts)
        : client_(client),
          reapply_attempts_(reapply_attempts ? reapply_attempts : 1)
    {
    }

    RefreshStatus refresh(const RefreshRequest &req)
    {
        RefreshStatus status;
        status.resource_id = req.resource_id;

        try
        {
            const ConnectionRef conn = client_.get_by_id(req.resource_id);
            if (!conn)
                throw refresh_error(Error::CONNECTION_NOT_FOUND, true, "no connection named " + req.resource_id);

            for (;;)
            {
                ++status.attempts;
                try
                {
                    if (client_.get_active(conn))
                    {
                        status.endpoint_applied = refresh_live(conn, req);
                        status.live = true;
                    }
                    else
                    {
                        status.endpoint_applied = refresh_saved(conn, req);
                        status.live = false;
                    }
                    break;
                }
                catch (const refresh_error &e)
                {
                    if (e.code() != Error::REAPPLY_FAILED || status.attempts >= reapply_attempts_)
                        throw;
                    LOG_INFO(req.resource_id << ": " << e.what() << ", retrying ("
                                             << status.attempts << '/' << reapply_attempts_ << ')');
                }
            }

            if (status.live)
                LOG_INFO(req.resource_id << ": updated live, no disconnection");
            else
                LOG_INFO(req.resource_id << ": updated saved profile, used on next activation");
            if (!status.endpoint_applied)
                status.message = "no peer in the wireguard settings, endpoint " + req.peer_endpoint + " not applied";
        }
        catch (const ExceptionCode &e)
        {
            status.error = e.code_defined() ? e.code() : Error::OPERATION_FAILED;
            status.message = e.what();
            LOG_ERROR(req.resource_id << ": refresh failed: " << e.what());
        }
        catch (const std::exception &e)
        {
            status.error = Error::OPERATION_FAILED;
            status.message = e.what();
            LOG_ERROR(req.resource_id << ": refresh failed: " << e.what());
        }
        return status;
    }

    // Refresh every request independently; one failure does not stop
    // the others.
    RefreshSummary refresh_all(const std::vector<RefreshRequest> &requests)
    {
        RefreshSummary summary;
        for (const auto &req : requests)
        {
            RefreshStatus status = refresh(req);
            if (status.ok())
            {
                ++summary.successful;
                if (status.live)
                    ++summary.live;
            }
            else
                ++summary.failed;
            summary.results.push_back(std::move(status));
        }
        LOG_INFO("refresh: " << summary.successful << " updated (" << summary.live << " live), "
                             << summary.failed << " failed");
        return summary;
    }

  private:
    // Both paths return whether the new endpoint found a peer to go to.
    bool refresh_live(const ConnectionRef &conn, const RefreshRequest &req)
    {
        LOG_VERBOSE(req.resource_id << ": active, reapplying");

        const DeviceRef device = client_.device_for(conn);
        if (!device)
            throw refresh_error(Error::DEVICE_NOT_FOUND, false, "active connection has no device");

        const std::optional<AppliedSnapshot> snapshot = client_.get_applied_connection(device);
        if (!snapshot)
            throw refresh_error(Error::SNAPSHOT_UNAVAILABLE, false, "cannot read applied connection of " + device.iface);

        bool endpoint_applied = false;
        const SettingsMap updated = WgUpdate::apply_credential_change(snapshot->settings,
                                                                      req.private_key,
                                                                      req.peer_endpoint,
                                                                      &endpoint_applied);

        if (!client_.reapply(device, updated, snapshot->version_id))
            throw refresh_error(Error::REAPPLY_FAILED, false, "reapply rejected on " + device.iface);
        return endpoint_applied;
    }

    bool refresh_saved(const ConnectionRef &conn, const RefreshRequest &req)
    {
        LOG_VERBOSE(req.resource_id << ": inactive, updating saved profile");

        const std::optional<SettingsMap> saved = client_.get_saved_settings(conn);
        if (!saved)
            throw refresh_error(Error::UPDATE_SAVED_FAILED, false, "cannot read saved settings");

        bool endpoint_applied = false;
        const SettingsMap updated = WgUpdate::apply_credential_change(*saved,
                                                                      req.private_key,
                                                                      req.peer_endpoint,
                                                                      &endpoint_applied);

        try
        {
            client_.update_saved(conn, updated).await(client_.timeout());
        }
        catch (const operation_failed &e)
        {
            std::string msg = e.what();
            if (e.is_insufficient_privileges())
            {
                msg += " (the profile may be owned by another user or the system; recreate it so that it belongs to you)";
                LOG_ERROR(req.resource_id << ": permission denied updating the saved profile. "
                                          << "Recreate the connection to fix its ownership.");
            }
            throw refresh_error(Error::UPDATE_SAVED_FAILED, false, msg);
        }
        catch (const operation_timeout &e)
        {
            throw refresh_error(Error::OPERATION_TIMEOUT, false, std::string(e.what()) + ", saved profile state unknown");
        }
        return endpoint_applied;
    }

    ConnectionClient &client_;
    const unsigned int reapply_attempts_;
};

} // namespace pianm

#endif
