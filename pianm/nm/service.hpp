//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Abstract interface to the network configuration service.
//
// The shape follows the service's native client library: every
// asynchronous operation is split into an *_async() call that takes a
// completion callback, and a *_finish() accessor that the callback
// uses to extract the result or the error.  Every method of every
// object declared here may only be called on the event loop thread
// that created the Service, and completions are delivered on that
// same thread.

#ifndef PIANM_NM_SERVICE_H
#define PIANM_NM_SERVICE_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <pianm/common/rc.hpp>
#include <pianm/nm/settings.hpp>
#include <pianm/nm/nmerr.hpp>

namespace pianm {

// Base of every object handed out by the service.
class ServiceObject : public RC<thread_safe_refcount>
{
  public:
    typedef RCPtr<ServiceObject> Ptr;
};

// Opaque handle passed to a completion callback, consumed by the
// matching *_finish() accessor.
class AsyncResult : public RC<thread_safe_refcount>
{
  public:
    typedef RCPtr<AsyncResult> Ptr;
};

// Completion callback.  On some internal failure paths of the service
// either argument may be null.
typedef std::function<void(ServiceObject *source, AsyncResult *result)> AsyncReadyCallback;

// Flags for Connection::update2_async()
enum Update2Flags : std::uint32_t
{
    UPDATE2_FLAG_NONE = 0,
    UPDATE2_FLAG_TO_DISK = 0x1,
    UPDATE2_FLAG_IN_MEMORY = 0x2,
};

class Device : public ServiceObject
{
  public:
    typedef RCPtr<Device> Ptr;

    virtual std::string iface() const = 0;

    virtual void get_applied_connection_async(std::uint32_t flags, AsyncReadyCallback callback) = 0;
    virtual AppliedSnapshot get_applied_connection_finish(AsyncResult *result) = 0;

    // Applies settings to the live device.  The service rejects the
    // call if version_id no longer matches the applied connection.
    virtual void reapply_async(const SettingsMap &settings,
                               std::uint64_t version_id,
                               std::uint32_t flags,
                               AsyncReadyCallback callback) = 0;
    virtual void reapply_finish(AsyncResult *result) = 0;
};

class Connection : public ServiceObject
{
  public:
    typedef RCPtr<Connection> Ptr;

    virtual std::string id() const = 0;
    virtual std::string uuid() const = 0;

    // Saved settings, secrets included.
    virtual SettingsMap to_settings() const = 0;

    virtual void update2_async(const SettingsMap &settings, std::uint32_t flags, AsyncReadyCallback callback) = 0;
    virtual void update2_finish(AsyncResult *result) = 0;

    virtual void delete_async(AsyncReadyCallback callback) = 0;
    virtual void delete_finish(AsyncResult *result) = 0;
};

class ActiveConnection : public ServiceObject
{
  public:
    typedef RCPtr<ActiveConnection> Ptr;

    // May be null while the service is tearing the activation down.
    virtual Connection::Ptr connection() const = 0;
    virtual std::vector<Device::Ptr> devices() const = 0;
};

class Service : public ServiceObject
{
  public:
    typedef RCPtr<Service> Ptr;

    virtual void add_connection_async(const SettingsMap &descriptor,
                                      bool save_to_disk,
                                      AsyncReadyCallback callback) = 0;
    virtual Connection::Ptr add_connection_finish(AsyncResult *result) = 0;

    // A null device lets the service pick one.
    virtual void activate_connection_async(const Connection::Ptr &connection,
                                           const Device::Ptr &device,
                                           const std::string &specific_object,
                                           AsyncReadyCallback callback) = 0;
    virtual ActiveConnection::Ptr activate_connection_finish(AsyncResult *result) = 0;

    // Lookups against the service's cached state.  A null Ptr means
    // no such connection.
    virtual Connection::Ptr get_connection_by_uuid(const std::string &uuid) const = 0;
    virtual Connection::Ptr get_connection_by_id(const std::string &id) const = 0;
    virtual std::vector<Connection::Ptr> get_connections() const = 0;
    virtual std::vector<ActiveConnection::Ptr> get_active_connections() const = 0;
};

} // namespace pianm

#endif
