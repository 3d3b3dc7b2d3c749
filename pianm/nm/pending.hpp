//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Bridge from the service's completion callbacks to futures.
//
// A PendingOperation stands for one in-flight async call.  It hands
// the service a native callback, and the caller a Future that the
// callback settles exactly once on the loop thread.

#ifndef PIANM_NM_PENDING_H
#define PIANM_NM_PENDING_H

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <string>
#include <type_traits>
#include <utility>

#include <pianm/common/rc.hpp>
#include <pianm/common/defect.hpp>
#include <pianm/nm/nmerr.hpp>
#include <pianm/nm/service.hpp>
#include <pianm/nm/loop.hpp>

namespace pianm {

// Error domain used for failures detected by the bridge itself rather
// than reported by the service.
constexpr char BRIDGE_ERROR_DOMAIN[] = "pianm-bridge-error";

template <typename T>
class Future
{
  public:
    Future() = default;

    explicit Future(std::shared_future<T> future)
        : future_(std::move(future))
    {
    }

    bool valid() const
    {
        return future_.valid();
    }

    bool ready() const
    {
        return future_.valid() && future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    /**
     * Blocks until the operation settles or timeout elapses.  May be
     * called any number of times, from any thread.
     *
     * @return the settled value
     * @throws operation_timeout when the operation is still in flight.
     *         The outcome is then unknown: the service may yet complete
     *         it.
     * @throws the exception the operation settled with
     * @throws operation_failed in the bridge domain when the operation
     *         was dropped without being settled
     */
    T await(const std::chrono::milliseconds timeout) const
    {
        if (!future_.valid())
            throw operation_failed(BRIDGE_ERROR_DOMAIN, 0, "await on an empty future");
        if (future_.wait_for(timeout) != std::future_status::ready)
            PIANM_THROW(operation_timeout, "no completion within " << timeout.count() << " ms");
        try
        {
            return future_.get();
        }
        catch (const std::future_error &e)
        {
            // the operation was released without ever being settled
            throw operation_failed(BRIDGE_ERROR_DOMAIN, 0, std::string("operation abandoned: ") + e.what());
        }
    }

  private:
    std::shared_future<T> future_;
};

template <typename T>
class PendingOperation : public RC<thread_safe_refcount>
{
  public:
    typedef RCPtr<PendingOperation> Ptr;

    // Extracts the result from the service, throwing operation_failed
    // on a service error.
    typedef std::function<T(AsyncResult *result)> Finish;

    PendingOperation(EventLoop &loop, std::string name, Finish finish)
        : loop_(loop),
          name_(std::move(name)),
          finish_(std::move(finish)),
          future_(promise_.get_future().share())
    {
    }

    const std::string &name() const
    {
        return name_;
    }

    Future<T> future() const
    {
        return future_;
    }

    bool settled() const
    {
        return settled_.load(std::memory_order_acquire);
    }

    // The native callback to hand to the service.  It keeps this
    // operation alive until the service drops it.
    AsyncReadyCallback callback()
    {
        Ptr self(this);
        return [self](ServiceObject *source, AsyncResult *result)
        { self->complete(source, result); };
    }

    void complete(ServiceObject *source, AsyncResult *result)
    {
        loop_.assert_on_loop_thread(name_);
        if (!claim())
            return;

        if (!source || !result)
        {
            promise_.set_exception(std::make_exception_ptr(
                operation_failed(BRIDGE_ERROR_DOMAIN,
                                 0,
                                 name_ + ": completion delivered without " + (source ? "a result" : "a source object"))));
            return;
        }

        try
        {
            if constexpr (std::is_void_v<T>)
            {
                // an empty payload is success for these operations
                finish_(result);
                promise_.set_value();
            }
            else
                promise_.set_value(finish_(result));
        }
        catch (const std::exception &)
        {
            promise_.set_exception(std::current_exception());
        }
    }

    // Settles with an error raised before the service accepted the
    // call, so no completion will follow.
    void fail(std::exception_ptr err)
    {
        if (claim())
            promise_.set_exception(std::move(err));
    }

  private:
    bool claim()
    {
        if (settled_.exchange(true, std::memory_order_acq_rel))
        {
            program_defect(name_ + ": pending operation settled twice");
            return false;
        }
        return true;
    }

    EventLoop &loop_;
    std::string name_;
    Finish finish_;
    std::promise<T> promise_;
    Future<T> future_;
    std::atomic<bool> settled_{false};
};

template <typename T>
typename PendingOperation<T>::Ptr make_pending(EventLoop &loop,
                                               std::string name,
                                               typename PendingOperation<T>::Finish finish)
{
    return typename PendingOperation<T>::Ptr(new PendingOperation<T>(loop, std::move(name), std::move(finish)));
}

} // namespace pianm

#endif
