//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// ConnectionClient: the thread-safe facade over the configuration
// service.  Every service call is marshaled onto the EventLoop, and
// the service objects it returns are wrapped in Ref values whose
// identifying fields were read on the loop thread.

#ifndef PIANM_NM_CLIENT_H
#define PIANM_NM_CLIENT_H

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <pianm/log/logger.hpp>
#include <pianm/nm/loop.hpp>
#include <pianm/nm/nmerr.hpp>
#include <pianm/nm/pending.hpp>
#include <pianm/nm/service.hpp>
#include <pianm/nm/settings.hpp>

namespace pianm {

struct ConnectionRef
{
    Connection::Ptr conn;
    std::string id;
    std::string uuid;

    explicit operator bool() const
    {
        return bool(conn);
    }
};

struct DeviceRef
{
    Device::Ptr device;
    std::string iface;

    explicit operator bool() const
    {
        return bool(device);
    }
};

struct ActiveConnectionRef
{
    ActiveConnection::Ptr active;
    ConnectionRef connection;

    explicit operator bool() const
    {
        return bool(active);
    }
};

class ConnectionClient : public logging::CoreLogging
{
  public:
    ConnectionClient(EventLoop &loop, const std::chrono::milliseconds timeout)
        : loop_(loop),
          timeout_(timeout)
    {
    }

    EventLoop &loop()
    {
        return loop_;
    }

    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

    // Persist a new connection.  Once the future resolves the
    // connection can be found with get_by_id() and list().
    Future<ConnectionRef> add(const SettingsMap &descriptor)
    {
        EventLoop *loop = &loop_;
        auto op = make_pending<ConnectionRef>(loop_, "add_connection", [loop](AsyncResult *res)
                                              { return make_ref(loop->service().add_connection_finish(res)); });
        return submit<ConnectionRef>(op, [loop, descriptor](AsyncReadyCallback cb)
                                     { loop->service().add_connection_async(descriptor, true, std::move(cb)); });
    }

    // Activate conn on device, or on a device of the service's choosing
    // when device is empty.
    Future<ActiveConnectionRef> activate(const ConnectionRef &conn, const DeviceRef &device = DeviceRef())
    {
        require(conn, "activate");
        EventLoop *loop = &loop_;
        Connection::Ptr c = conn.conn;
        Device::Ptr d = device.device;
        auto op = make_pending<ActiveConnectionRef>(loop_, "activate_connection", [loop](AsyncResult *res)
                                                    { return make_active_ref(loop->service().activate_connection_finish(res)); });
        return submit<ActiveConnectionRef>(op, [loop, c, d](AsyncReadyCallback cb)
                                           { loop->service().activate_connection_async(c, d, std::string(), std::move(cb)); });
    }

    Future<void> remove(const ConnectionRef &conn)
    {
        require(conn, "remove");
        Connection::Ptr c = conn.conn;
        auto op = make_pending<void>(loop_, "delete_connection", [c](AsyncResult *res)
                                     { c->delete_finish(res); });
        return submit<void>(op, [c](AsyncReadyCallback cb)
                            { c->delete_async(std::move(cb)); });
    }

    // Empty ConnectionRef when no connection has this id.
    ConnectionRef get_by_id(const std::string &id)
    {
        return loop_.call([this, &id]()
                          { return make_ref(loop_.service().get_connection_by_id(id)); });
    }

    ConnectionRef get_by_uuid(const std::string &uuid)
    {
        return loop_.call([this, &uuid]()
                          { return make_ref(loop_.service().get_connection_by_uuid(uuid)); });
    }

    std::vector<ConnectionRef> list()
    {
        return loop_.call([this]()
                          {
            std::vector<ConnectionRef> ret;
            for (const auto &c : loop_.service().get_connections())
                ret.push_back(make_ref(c));
            return ret; });
    }

    // The active instance of the connection named id, first match.
    ActiveConnectionRef get_active(const std::string &id)
    {
        return loop_.call([this, &id]()
                          {
            for (const auto &ac : loop_.service().get_active_connections())
            {
                const Connection::Ptr c = ac->connection();
                if (c && c->id() == id)
                    return make_active_ref(ac);
            }
            return ActiveConnectionRef(); });
    }

    // The active instance of conn itself.  Ids need not be unique, so
    // this matches on uuid.
    ActiveConnectionRef get_active(const ConnectionRef &conn)
    {
        if (!conn)
            return ActiveConnectionRef();
        return loop_.call([this, &conn]()
                          {
            for (const auto &ac : loop_.service().get_active_connections())
            {
                const Connection::Ptr c = ac->connection();
                if (c && c->uuid() == conn.uuid)
                    return make_active_ref(ac);
            }
            return ActiveConnectionRef(); });
    }

    // First device of the first active instance of conn.  Empty when
    // conn is not active or its activation has no device.
    DeviceRef device_for(const ConnectionRef &conn)
    {
        return loop_.call([this, &conn]()
                          {
            for (const auto &ac : loop_.service().get_active_connections())
            {
                const Connection::Ptr c = ac->connection();
                if (!c || c->uuid() != conn.uuid)
                    continue;
                const std::vector<Device::Ptr> devs = ac->devices();
                if (devs.empty())
                    return DeviceRef();
                return DeviceRef{devs.front(), devs.front()->iface()};
            }
            return DeviceRef(); });
    }

    /**
     * Applies settings to a live device.  Best effort: every failure,
     * a rejected version_id and a timeout included, is logged and
     * returned as false.
     */
    bool reapply(const DeviceRef &device, const SettingsMap &settings, const std::uint64_t version_id)
    {
        if (!device)
            return false;
        Device::Ptr d = device.device;
        auto op = make_pending<void>(loop_, "reapply", [d](AsyncResult *res)
                                     { d->reapply_finish(res); });
        try
        {
            submit<void>(op, [d, settings, version_id](AsyncReadyCallback cb)
                         { d->reapply_async(settings, version_id, 0, std::move(cb)); })
                .await(timeout_);
            LOG_DEBUG("reapply on " << device.iface << " accepted (version " << version_id << ')');
            return true;
        }
        catch (const std::exception &e)
        {
            LOG_INFO("reapply on " << device.iface << " failed: " << e.what());
            return false;
        }
    }

    // Settings and version id currently applied to device, or nullopt
    // when they cannot be read for any reason.
    std::optional<AppliedSnapshot> get_applied_connection(const DeviceRef &device)
    {
        if (!device)
            return std::nullopt;
        Device::Ptr d = device.device;
        auto op = make_pending<AppliedSnapshot>(loop_, "get_applied_connection", [d](AsyncResult *res)
                                                { return d->get_applied_connection_finish(res); });
        try
        {
            return submit<AppliedSnapshot>(op, [d](AsyncReadyCallback cb)
                                           { d->get_applied_connection_async(0, std::move(cb)); })
                .await(timeout_);
        }
        catch (const std::exception &e)
        {
            LOG_INFO("cannot read applied connection of " << device.iface << ": " << e.what());
            return std::nullopt;
        }
    }

    // Saved settings of conn, secrets included, or nullopt.
    std::optional<SettingsMap> get_saved_settings(const ConnectionRef &conn)
    {
        if (!conn)
            return std::nullopt;
        Connection::Ptr c = conn.conn;
        try
        {
            return loop_.call([c]()
                              { return c->to_settings(); });
        }
        catch (const std::exception &e)
        {
            LOG_INFO("cannot read saved settings of " << conn.id << ": " << e.what());
            return std::nullopt;
        }
    }

    // Replace the saved profile of conn.  The active instance, if any,
    // is not touched.
    Future<void> update_saved(const ConnectionRef &conn, const SettingsMap &settings)
    {
        require(conn, "update_saved");
        Connection::Ptr c = conn.conn;
        auto op = make_pending<void>(loop_, "update2", [c](AsyncResult *res)
                                     { c->update2_finish(res); });
        return submit<void>(op, [c, settings](AsyncReadyCallback cb)
                            { c->update2_async(settings, UPDATE2_FLAG_NONE, std::move(cb)); });
    }

  private:
    static void require(const ConnectionRef &conn, const char *what)
    {
        if (!conn)
            throw operation_failed(BRIDGE_ERROR_DOMAIN, 0, std::string(what) + ": empty connection reference");
    }

    static ConnectionRef make_ref(const Connection::Ptr &c)
    {
        if (!c)
            return ConnectionRef();
        return ConnectionRef{c, c->id(), c->uuid()};
    }

    static ActiveConnectionRef make_active_ref(const ActiveConnection::Ptr &ac)
    {
        if (!ac)
            return ActiveConnectionRef();
        return ActiveConnectionRef{ac, make_ref(ac->connection())};
    }

    // Issue the native call on the loop thread.  If issuing it throws,
    // no completion will come, so the operation settles right there.
    template <typename T, typename ISSUE>
    Future<T> submit(const typename PendingOperation<T>::Ptr &op, ISSUE issue)
    {
        LOG_TRACE("submit " << op->name());
        loop_.run_on([op, issue]()
                     {
            try
            {
                issue(op->callback());
            }
            catch (const std::exception &)
            {
                op->fail(std::current_exception());
            } });
        return op->future();
    }

    EventLoop &loop_;
    std::chrono::milliseconds timeout_;
};

} // namespace pianm

#endif
