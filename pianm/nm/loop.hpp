//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// The event loop that owns the configuration service.
//
// One EventLoop is created at process start and handed to everything
// that talks to the service.  It runs an asio io_context on a
// dedicated thread, constructs the Service on that thread, and is the
// only place service calls may be issued from.

#ifndef PIANM_NM_LOOP_H
#define PIANM_NM_LOOP_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <pianm/io/io.hpp>
#include <pianm/common/rc.hpp>
#include <pianm/common/defect.hpp>
#include <pianm/log/logger.hpp>
#include <pianm/nm/nmerr.hpp>
#include <pianm/nm/service.hpp>

namespace pianm {

class EventLoop : public RC<thread_safe_refcount>, public logging::CoreLogging
{
  public:
    typedef RCPtr<EventLoop> Ptr;

    // Builds the service client.  Runs on the loop thread, so the
    // factory may bind the service library to the thread's context.
    typedef std::function<Service::Ptr(EventLoop &loop)> ServiceFactory;

    enum State
    {
        NOT_STARTED,
        STARTING,
        RUNNING,
        FAILED,
    };

    explicit EventLoop(ServiceFactory factory)
        : factory_(std::move(factory)),
          work_guard_(new WorkGuard(io_context_.get_executor()))
    {
    }

    ~EventLoop()
    {
        stop();
    }

    /**
     * Starts the loop thread and constructs the service, once.  Safe to
     * call from any number of threads concurrently: late callers wait
     * for the first one to finish instead of starting a second thread.
     *
     * @throws startup_failed if the service cannot be constructed.  The
     *         failure is permanent for this EventLoop.
     */
    void ensure_started()
    {
        if (state_.load(std::memory_order_acquire) == RUNNING)
            return;

        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ == NOT_STARTED)
        {
            state_.store(STARTING, std::memory_order_release);
            thread_ = std::thread(&EventLoop::thread_func, this);
        }
        state_cond_.wait(lock, [this]()
                         { return state_ != STARTING; });

        if (state_ == FAILED)
        {
            if (thread_.joinable())
                thread_.join();
            throw startup_failed(startup_error_);
        }
    }

    State state() const
    {
        return state_.load(std::memory_order_acquire);
    }

    // Queue fn on the loop thread and return immediately.  An exception
    // escaping fn is logged and does not stop the loop.
    void run_on(std::function<void()> fn)
    {
        ensure_started();
        pianm_io::post(io_context_, std::move(fn));
    }

    /**
     * Runs fn on the loop thread and waits for its result, which may
     * be an exception.  Called from the loop thread itself, fn runs
     * inline.
     */
    template <typename F>
    auto call(F &&fn) -> decltype(fn())
    {
        typedef decltype(fn()) R;

        ensure_started();
        if (on_loop_thread())
            return fn();

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        pianm_io::post(io_context_, [task]()
                       { (*task)(); });
        return result.get();
    }

    bool on_loop_thread() const
    {
        return loop_thread_id_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    void assert_on_loop_thread(const std::string &where) const
    {
        if (!on_loop_thread())
            program_defect(where + ": " + Error::name(Error::NOT_ON_LOOP_THREAD));
    }

    // The service client.  Loop thread only.
    Service &service()
    {
        assert_on_loop_thread("EventLoop::service");
        return *service_;
    }

    pianm_io::io_context &io_context()
    {
        return io_context_;
    }

  private:
    typedef pianm_io::executor_work_guard<pianm_io::io_context::executor_type> WorkGuard;

    void thread_func()
    {
        Log::Context logctx(logwrap_);
        loop_thread_id_.store(std::this_thread::get_id(), std::memory_order_release);

        try
        {
            Service::Ptr svc = factory_(*this);
            if (!svc)
                throw Exception("service factory returned no service");
            service_ = std::move(svc);
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("EventLoop: cannot create service client: " << e.what());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                startup_error_ = e.what();
                state_.store(FAILED, std::memory_order_release);
            }
            state_cond_.notify_all();
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_.store(RUNNING, std::memory_order_release);
        }
        state_cond_.notify_all();
        LOG_VERBOSE("EventLoop: running");

        for (;;)
        {
            try
            {
                io_context_.run();
                break;
            }
            catch (const std::exception &e)
            {
                LOG_ERROR("EventLoop: handler failed: " << e.what());
            }
        }

        // the service must not outlive its thread
        service_.reset();
        LOG_VERBOSE("EventLoop: stopped");
    }

    void stop()
    {
        if (!thread_.joinable())
            return;
        if (on_loop_thread())
        {
            program_defect("EventLoop destroyed from its own thread");
            thread_.detach();
            return;
        }
        pianm_io::post(io_context_, [this]()
                       { io_context_.stop(); });
        work_guard_.reset();
        thread_.join();
    }

    ServiceFactory factory_;
    pianm_io::io_context io_context_{1};
    std::unique_ptr<WorkGuard> work_guard_;
    Service::Ptr service_;

    std::mutex mutex_;
    std::condition_variable state_cond_;
    std::atomic<State> state_{NOT_STARTED};
    std::string startup_error_;

    std::thread thread_;
    std::atomic<std::thread::id> loop_thread_id_{};
    Log::Context::Wrapper logwrap_; // carries the creating thread's log context to the loop thread
};

} // namespace pianm

#endif
