//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// The configuration service implemented on top of libnm.
//
// libnm delivers every completion and property change through the
// GMainContext that was the thread default when the NMClient was
// created.  LibnmService creates a private context on the event loop
// thread, makes it the thread default for the lifetime of the client,
// and drives it from an asio timer, so that GLib dispatch and the
// asio handlers of the loop share one thread.

#ifndef PIANM_LIBNM_LIBNMSERVICE_H
#define PIANM_LIBNM_LIBNMSERVICE_H

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <NetworkManager.h>

#include <pianm/io/io.hpp>
#include <pianm/common/rc.hpp>
#include <pianm/log/logger.hpp>
#include <pianm/nm/loop.hpp>
#include <pianm/nm/nmerr.hpp>
#include <pianm/nm/pending.hpp>
#include <pianm/nm/service.hpp>
#include <pianm/libnm/variant.hpp>

namespace pianm {
namespace libnm {

// Throws the GError as operation_failed, freeing it.
[[noreturn]] inline void throw_gerror(GError *err, const char *what)
{
    if (!err)
        throw operation_failed("libnm", 0, std::string(what) + " failed without error details");
    const std::string domain = g_quark_to_string(err->domain);
    const int code = err->code;
    const std::string message = err->message ? err->message : "";
    g_error_free(err);
    throw operation_failed(domain, code, message);
}

// A strong reference to a GObject, released on the event loop thread.
template <typename T>
class NativeRef
{
  public:
    NativeRef(EventLoop &loop, T *obj)
        : loop_(loop),
          obj_(obj)
    {
        if (obj_)
            g_object_ref(obj_);
    }

    ~NativeRef()
    {
        if (!obj_)
            return;
        if (loop_.on_loop_thread())
            g_object_unref(obj_);
        else
        {
            gpointer obj = obj_;
            pianm_io::post(loop_.io_context(), [obj]()
                           { g_object_unref(obj); });
        }
    }

    NativeRef(const NativeRef &) = delete;
    NativeRef &operator=(const NativeRef &) = delete;

    T *get() const
    {
        return obj_;
    }

  private:
    EventLoop &loop_;
    T *obj_;
};

class GAsyncResultRef : public AsyncResult
{
  public:
    explicit GAsyncResultRef(GAsyncResult *res)
        : res_(G_ASYNC_RESULT(g_object_ref(res)))
    {
    }

    ~GAsyncResultRef()
    {
        g_object_unref(res_);
    }

    static GAsyncResult *native(AsyncResult *result)
    {
        GAsyncResultRef *r = dynamic_cast<GAsyncResultRef *>(result);
        if (!r)
            throw operation_failed(BRIDGE_ERROR_DOMAIN, 0, "result was not produced by libnm");
        return r->res_;
    }

  private:
    GAsyncResult *res_;
};

// user_data of every libnm async call: the wrapper that issued it and
// the callback to run on completion.
class ReadyCallback : public logging::CoreLogging
{
  public:
    static gpointer make(ServiceObject *source, AsyncReadyCallback callback)
    {
        return new ReadyCallback(source, std::move(callback));
    }

    static void ready(GObject *source_object, GAsyncResult *res, gpointer user_data)
    {
        std::unique_ptr<ReadyCallback> self(static_cast<ReadyCallback *>(user_data));
        ServiceObject *source = source_object ? self->source_.get() : nullptr;
        try
        {
            if (res)
            {
                AsyncResult::Ptr result(new GAsyncResultRef(res));
                self->callback_(source, result.get());
            }
            else
                self->callback_(source, nullptr);
        }
        catch (const std::exception &e)
        {
            // must not unwind through GLib
            LOG_ERROR("libnm completion handler failed: " << e.what());
        }
    }

  private:
    ReadyCallback(ServiceObject *source, AsyncReadyCallback callback)
        : source_(source),
          callback_(std::move(callback))
    {
    }

    ServiceObject::Ptr source_;
    AsyncReadyCallback callback_;
};

// Settings built into an NMConnection with the D-Bus types of templ.
inline NMConnection *new_connection(const SettingsMap &settings, GVariant *templ)
{
    VariantPtr dict = VariantConv::settings_to_variant(settings, templ);
    GError *err = nullptr;
    NMConnection *conn = nm_simple_connection_new_from_dbus(dict.get(), &err);
    if (!conn)
        throw_gerror(err, "nm_simple_connection_new_from_dbus");
    return conn;
}

class LibnmConnection : public Connection
{
  public:
    typedef RCPtr<LibnmConnection> Ptr;

    LibnmConnection(EventLoop &loop, NMRemoteConnection *rc)
        : loop_(loop),
          rc_(loop, rc)
    {
    }

    NMRemoteConnection *native() const
    {
        return rc_.get();
    }

    std::string id() const override
    {
        const char *id = nm_connection_get_id(NM_CONNECTION(rc_.get()));
        return id ? id : "";
    }

    std::string uuid() const override
    {
        const char *uuid = nm_connection_get_uuid(NM_CONNECTION(rc_.get()));
        return uuid ? uuid : "";
    }

    SettingsMap to_settings() const override
    {
        return VariantConv::settings_from_variant(dbus().get());
    }

    void update2_async(const SettingsMap &settings, std::uint32_t flags, AsyncReadyCallback callback) override
    {
        loop_.assert_on_loop_thread("Connection::update2_async");
        VariantPtr dict = VariantConv::settings_to_variant(settings, dbus().get());
        VariantPtr args = sink(g_variant_new_array(G_VARIANT_TYPE("{sv}"), nullptr, 0));
        nm_remote_connection_update2(rc_.get(),
                                     dict.get(),
                                     NMSettingsUpdate2Flags(flags),
                                     args.get(),
                                     nullptr,
                                     &ReadyCallback::ready,
                                     ReadyCallback::make(this, std::move(callback)));
    }

    void update2_finish(AsyncResult *result) override
    {
        GError *err = nullptr;
        GVariant *ret = nm_remote_connection_update2_finish(rc_.get(), GAsyncResultRef::native(result), &err);
        if (err)
            throw_gerror(err, "update2");
        if (ret)
            g_variant_unref(ret);
    }

    void delete_async(AsyncReadyCallback callback) override
    {
        loop_.assert_on_loop_thread("Connection::delete_async");
        nm_remote_connection_delete_async(rc_.get(),
                                          nullptr,
                                          &ReadyCallback::ready,
                                          ReadyCallback::make(this, std::move(callback)));
    }

    void delete_finish(AsyncResult *result) override
    {
        GError *err = nullptr;
        if (!nm_remote_connection_delete_finish(rc_.get(), GAsyncResultRef::native(result), &err))
            throw_gerror(err, "delete");
    }

    // The saved settings as a connection dictionary.
    VariantPtr dbus() const
    {
        return sink(nm_connection_to_dbus(NM_CONNECTION(rc_.get()), NM_CONNECTION_SERIALIZE_ALL));
    }

  private:
    EventLoop &loop_;
    NativeRef<NMRemoteConnection> rc_;
};

class LibnmDevice : public Device
{
  public:
    typedef RCPtr<LibnmDevice> Ptr;

    LibnmDevice(EventLoop &loop, NMDevice *dev)
        : loop_(loop),
          dev_(loop, dev)
    {
    }

    NMDevice *native() const
    {
        return dev_.get();
    }

    std::string iface() const override
    {
        const char *iface = nm_device_get_iface(dev_.get());
        return iface ? iface : "";
    }

    void get_applied_connection_async(std::uint32_t flags, AsyncReadyCallback callback) override
    {
        loop_.assert_on_loop_thread("Device::get_applied_connection_async");
        nm_device_get_applied_connection_async(dev_.get(),
                                               flags,
                                               nullptr,
                                               &ReadyCallback::ready,
                                               ReadyCallback::make(this, std::move(callback)));
    }

    AppliedSnapshot get_applied_connection_finish(AsyncResult *result) override
    {
        guint64 version_id = 0;
        GError *err = nullptr;
        NMConnection *conn = nm_device_get_applied_connection_finish(dev_.get(),
                                                                     GAsyncResultRef::native(result),
                                                                     &version_id,
                                                                     &err);
        if (!conn)
            throw_gerror(err, "get_applied_connection");
        VariantPtr dict = sink(nm_connection_to_dbus(conn, NM_CONNECTION_SERIALIZE_ALL));
        g_object_unref(conn);

        AppliedSnapshot snap;
        snap.settings = VariantConv::settings_from_variant(dict.get());
        snap.version_id = version_id;
        applied_ = std::move(dict);
        return snap;
    }

    void reapply_async(const SettingsMap &settings,
                       std::uint64_t version_id,
                       std::uint32_t flags,
                       AsyncReadyCallback callback) override
    {
        loop_.assert_on_loop_thread("Device::reapply_async");
        VariantPtr templ = reapply_template();
        NMConnection *conn = new_connection(settings, templ.get());
        nm_device_reapply_async(dev_.get(),
                                conn,
                                version_id,
                                flags,
                                nullptr,
                                &ReadyCallback::ready,
                                ReadyCallback::make(this, std::move(callback)));
        g_object_unref(conn);
    }

    void reapply_finish(AsyncResult *result) override
    {
        GError *err = nullptr;
        if (!nm_device_reapply_finish(dev_.get(), GAsyncResultRef::native(result), &err))
            throw_gerror(err, "reapply");
    }

  private:
    // The applied connection last read through this wrapper, else the
    // saved profile of the device's active connection.
    VariantPtr reapply_template() const
    {
        if (applied_)
            return VariantPtr(g_variant_ref(applied_.get()));
        NMActiveConnection *ac = nm_device_get_active_connection(dev_.get());
        NMRemoteConnection *rc = ac ? nm_active_connection_get_connection(ac) : nullptr;
        if (!rc)
            return VariantPtr();
        return sink(nm_connection_to_dbus(NM_CONNECTION(rc), NM_CONNECTION_SERIALIZE_ALL));
    }

    EventLoop &loop_;
    NativeRef<NMDevice> dev_;
    VariantPtr applied_;
};

class LibnmActiveConnection : public ActiveConnection
{
  public:
    LibnmActiveConnection(EventLoop &loop, NMActiveConnection *ac)
        : loop_(loop),
          ac_(loop, ac)
    {
    }

    Connection::Ptr connection() const override
    {
        NMRemoteConnection *rc = nm_active_connection_get_connection(ac_.get());
        if (!rc)
            return Connection::Ptr();
        return Connection::Ptr(new LibnmConnection(loop_, rc));
    }

    std::vector<Device::Ptr> devices() const override
    {
        std::vector<Device::Ptr> ret;
        const GPtrArray *devs = nm_active_connection_get_devices(ac_.get());
        if (devs)
            for (guint i = 0; i < devs->len; ++i)
                ret.emplace_back(new LibnmDevice(loop_, NM_DEVICE(g_ptr_array_index(devs, i))));
        return ret;
    }

  private:
    EventLoop &loop_;
    NativeRef<NMActiveConnection> ac_;
};

class LibnmService : public Service, public logging::CoreLogging
{
  public:
    typedef RCPtr<LibnmService> Ptr;

    // Must run on the event loop thread: the NMClient binds to the
    // thread default main context at construction.
    static Service::Ptr create(EventLoop &loop, const std::chrono::milliseconds pump_interval)
    {
        return Service::Ptr(new LibnmService(loop, pump_interval));
    }

    ~LibnmService()
    {
        pump_timer_.cancel();
        g_object_unref(client_);
        while (g_main_context_iteration(context_, FALSE))
            ;
        g_main_context_pop_thread_default(context_);
        g_main_context_unref(context_);
    }

    void add_connection_async(const SettingsMap &descriptor,
                              bool save_to_disk,
                              AsyncReadyCallback callback) override
    {
        loop_.assert_on_loop_thread("Service::add_connection_async");
        NMConnection *conn = new_connection(descriptor, nullptr);
        nm_client_add_connection_async(client_,
                                       conn,
                                       save_to_disk,
                                       nullptr,
                                       &ReadyCallback::ready,
                                       ReadyCallback::make(this, std::move(callback)));
        g_object_unref(conn);
    }

    Connection::Ptr add_connection_finish(AsyncResult *result) override
    {
        GError *err = nullptr;
        NMRemoteConnection *rc = nm_client_add_connection_finish(client_, GAsyncResultRef::native(result), &err);
        if (!rc)
            throw_gerror(err, "add_connection");
        Connection::Ptr ret(new LibnmConnection(loop_, rc));
        g_object_unref(rc);
        return ret;
    }

    void activate_connection_async(const Connection::Ptr &connection,
                                   const Device::Ptr &device,
                                   const std::string &specific_object,
                                   AsyncReadyCallback callback) override
    {
        loop_.assert_on_loop_thread("Service::activate_connection_async");
        LibnmConnection *c = dynamic_cast<LibnmConnection *>(connection.get());
        LibnmDevice *d = dynamic_cast<LibnmDevice *>(device.get());
        nm_client_activate_connection_async(client_,
                                            c ? NM_CONNECTION(c->native()) : nullptr,
                                            d ? d->native() : nullptr,
                                            specific_object.empty() ? nullptr : specific_object.c_str(),
                                            nullptr,
                                            &ReadyCallback::ready,
                                            ReadyCallback::make(this, std::move(callback)));
    }

    ActiveConnection::Ptr activate_connection_finish(AsyncResult *result) override
    {
        GError *err = nullptr;
        NMActiveConnection *ac = nm_client_activate_connection_finish(client_, GAsyncResultRef::native(result), &err);
        if (!ac)
            throw_gerror(err, "activate_connection");
        ActiveConnection::Ptr ret(new LibnmActiveConnection(loop_, ac));
        g_object_unref(ac);
        return ret;
    }

    Connection::Ptr get_connection_by_uuid(const std::string &uuid) const override
    {
        return wrap(nm_client_get_connection_by_uuid(client_, uuid.c_str()));
    }

    Connection::Ptr get_connection_by_id(const std::string &id) const override
    {
        return wrap(nm_client_get_connection_by_id(client_, id.c_str()));
    }

    std::vector<Connection::Ptr> get_connections() const override
    {
        std::vector<Connection::Ptr> ret;
        const GPtrArray *conns = nm_client_get_connections(client_);
        for (guint i = 0; conns && i < conns->len; ++i)
            ret.push_back(wrap(NM_REMOTE_CONNECTION(g_ptr_array_index(conns, i))));
        return ret;
    }

    std::vector<ActiveConnection::Ptr> get_active_connections() const override
    {
        std::vector<ActiveConnection::Ptr> ret;
        const GPtrArray *acs = nm_client_get_active_connections(client_);
        for (guint i = 0; acs && i < acs->len; ++i)
            ret.emplace_back(new LibnmActiveConnection(loop_, NM_ACTIVE_CONNECTION(g_ptr_array_index(acs, i))));
        return ret;
    }

  private:
    LibnmService(EventLoop &loop, const std::chrono::milliseconds pump_interval)
        : loop_(loop),
          pump_interval_(pump_interval),
          pump_timer_(loop.io_context()),
          context_(g_main_context_new())
    {
        loop_.assert_on_loop_thread("LibnmService");
        g_main_context_push_thread_default(context_);

        GError *err = nullptr;
        client_ = nm_client_new(nullptr, &err);
        if (!client_)
        {
            g_main_context_pop_thread_default(context_);
            g_main_context_unref(context_);
            throw_gerror(err, "nm_client_new");
        }
        LOG_VERBOSE("libnm: connected to NetworkManager " << (nm_client_get_version(client_) ? nm_client_get_version(client_) : "?"));
        schedule_pump();
    }

    Connection::Ptr wrap(NMRemoteConnection *rc) const
    {
        if (!rc)
            return Connection::Ptr();
        return Connection::Ptr(new LibnmConnection(loop_, rc));
    }

    // Dispatch whatever GLib has pending, then come back after
    // pump_interval_.
    void schedule_pump()
    {
        pump_timer_.expires_after(pump_interval_);
        pump_timer_.async_wait([this](const boost::system::error_code &error)
                               {
            if (error)
                return;
            for (int i = 0; i < 64 && g_main_context_iteration(context_, FALSE); ++i)
                ;
            schedule_pump(); });
    }

    EventLoop &loop_;
    std::chrono::milliseconds pump_interval_;
    pianm_io::steady_timer pump_timer_;
    GMainContext *context_;
    NMClient *client_ = nullptr;
};

inline EventLoop::ServiceFactory make_service_factory(const std::chrono::milliseconds pump_interval)
{
    return [pump_interval](EventLoop &loop)
    { return LibnmService::create(loop, pump_interval); };
}

} // namespace libnm
} // namespace pianm

#endif
