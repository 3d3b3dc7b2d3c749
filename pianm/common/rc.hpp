//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Reference counting based on boost::intrusive_ptr.  Inherit from RC
// to create an object that can be tracked with an intrusive_ptr.
//
// Objects handed out by the configuration service, pending operations
// and the event loop are shared between the loop thread and caller
// threads, so only the thread-safe count is provided.
//
// Any object that inherits from RC should also declare a Ptr typedef:
//
// class Foo : public RC<thread_safe_refcount> {
// public:
//   typedef RCPtr<Foo> Ptr;
// };

#ifndef PIANM_COMMON_RC_H
#define PIANM_COMMON_RC_H

#include <atomic>

#include <boost/intrusive_ptr.hpp>

namespace pianm {

// The smart pointer
template <typename T>
using RCPtr = boost::intrusive_ptr<T>;

class thread_safe_refcount
{
    thread_safe_refcount(const thread_safe_refcount &) = delete;
    thread_safe_refcount &operator=(const thread_safe_refcount &) = delete;

  public:
    thread_safe_refcount() noexcept
        : rc(0)
    {
    }

    void operator++() noexcept
    {
        rc.fetch_add(1, std::memory_order_relaxed);
    }

    long operator--() noexcept
    {
        const long ret = rc.fetch_sub(1, std::memory_order_release) - 1;
        if (ret == 0)
            std::atomic_thread_fence(std::memory_order_acquire);
        return ret;
    }

    long use_count() const noexcept
    {
        return rc.load(std::memory_order_relaxed);
    }

  private:
    std::atomic<long> rc;
};

// Reference count base class for objects tracked by boost::intrusive_ptr.
// Disallows copying and assignment.
template <typename RCImpl>
class RC
{
    RC(const RC &) = delete;
    RC &operator=(const RC &) = delete;

  public:
    RC() noexcept
    {
    }

    virtual ~RC()
    {
    }

    long use_count() const noexcept
    {
        return refcount_.use_count();
    }

  private:
    template <typename R>
    friend void intrusive_ptr_add_ref(R *p) noexcept;
    template <typename R>
    friend void intrusive_ptr_release(R *p) noexcept;
    RCImpl refcount_;
};

template <typename R>
inline void intrusive_ptr_add_ref(R *p) noexcept
{
    ++p->refcount_;
}

template <typename R>
inline void intrusive_ptr_release(R *p) noexcept
{
    if (--p->refcount_ == 0)
        delete p;
}

} // namespace pianm

#endif // PIANM_COMMON_RC_H
