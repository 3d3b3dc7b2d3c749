//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

#include "test_common.hpp"
#include "fake_service.hpp"

#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <pianm/nm/loop.hpp>

using namespace pianm;
using namespace pianm::test;

namespace {

EventLoop::ServiceFactory counting_factory(std::atomic<int> &count)
{
    return [&count](EventLoop &loop)
    {
        ++count;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return Service::Ptr(new FakeService(loop));
    };
}

} // namespace

TEST(EventLoop, NotStartedUntilUsed)
{
    std::atomic<int> created{0};
    EventLoop::Ptr loop(new EventLoop(counting_factory(created)));
    EXPECT_EQ(loop->state(), EventLoop::NOT_STARTED);
    EXPECT_EQ(created.load(), 0);
    EXPECT_FALSE(loop->on_loop_thread());
}

TEST(EventLoop, ConcurrentStartCreatesOneService)
{
    std::atomic<int> created{0};
    EventLoop::Ptr loop(new EventLoop(counting_factory(created)));

    std::vector<std::thread> threads;
    std::atomic<int> started{0};
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&]()
                             {
            loop->ensure_started();
            ++started; });
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(started.load(), 8);
    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(loop->state(), EventLoop::RUNNING);

    // later callers take the fast path
    loop->ensure_started();
    EXPECT_EQ(created.load(), 1);
}

TEST(EventLoop, RunOnExecutesOnLoopThread)
{
    EventLoop::Ptr loop(new EventLoop([](EventLoop &l)
                                      { return Service::Ptr(new FakeService(l)); }));

    std::promise<std::thread::id> where;
    loop->run_on([&where, &loop]()
                 {
        EXPECT_TRUE(loop->on_loop_thread());
        where.set_value(std::this_thread::get_id()); });

    const std::thread::id loop_id = where.get_future().get();
    EXPECT_NE(loop_id, std::this_thread::get_id());
}

TEST(EventLoop, HandlersRunInSubmissionOrder)
{
    EventLoop::Ptr loop(new EventLoop([](EventLoop &l)
                                      { return Service::Ptr(new FakeService(l)); }));

    std::vector<int> order;
    for (int i = 0; i < 10; ++i)
        loop->run_on([&order, i]()
                     { order.push_back(i); });
    const size_t n = loop->call([&order]()
                                { return order.size(); });

    ASSERT_EQ(n, 10u);
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(order[i], i);
}

TEST(EventLoop, CallReturnsValueAndException)
{
    EventLoop::Ptr loop(new EventLoop([](EventLoop &l)
                                      { return Service::Ptr(new FakeService(l)); }));

    EXPECT_EQ(loop->call([]()
                         { return 42; }),
              42);
    EXPECT_THROW(loop->call([]() -> int
                            { throw operation_failed("test", 1, "boom"); }),
                 operation_failed);

    // nested call from the loop thread runs inline instead of deadlocking
    const bool inline_ok = loop->call([&loop]()
                                      { return loop->call([&loop]()
                                                          { return loop->on_loop_thread(); }); });
    EXPECT_TRUE(inline_ok);
}

TEST(EventLoop, ThrowingHandlerDoesNotStopLoop)
{
    EventLoop::Ptr loop(new EventLoop([](EventLoop &l)
                                      { return Service::Ptr(new FakeService(l)); }));

    testLog->startCollecting();
    loop->run_on([]()
                 { throw Exception("handler exploded"); });
    const int v = loop->call([]()
                             { return 7; });
    const std::string output = testLog->stopCollecting();

    EXPECT_EQ(v, 7);
    EXPECT_EQ(loop->state(), EventLoop::RUNNING);
    EXPECT_NE(output.find("handler exploded"), std::string::npos) << output;
}

TEST(EventLoop, StartupFailureIsPermanent)
{
    std::atomic<int> attempts{0};
    EventLoop::Ptr loop(new EventLoop([&attempts](EventLoop &) -> Service::Ptr
                                      {
        ++attempts;
        throw Exception("no system bus"); }));

    testLog->startCollecting();
    try
    {
        loop->ensure_started();
        FAIL() << "startup_failed expected";
    }
    catch (const startup_failed &e)
    {
        EXPECT_EQ(e.code(), Error::STARTUP_FAILED);
        EXPECT_TRUE(e.fatal());
        EXPECT_NE(std::string(e.what()).find("no system bus"), std::string::npos);
    }
    testLog->stopCollecting();

    EXPECT_EQ(loop->state(), EventLoop::FAILED);
    EXPECT_THROW(loop->ensure_started(), startup_failed);
    EXPECT_THROW(loop->run_on([]() {}), startup_failed);
    EXPECT_EQ(attempts.load(), 1);
}

TEST(EventLoop, NullServiceIsStartupFailure)
{
    EventLoop::Ptr loop(new EventLoop([](EventLoop &)
                                      { return Service::Ptr(); }));
    testLog->startCollecting();
    EXPECT_THROW(loop->ensure_started(), startup_failed);
    testLog->stopCollecting();
}

TEST(EventLoop, ServiceOnlyFromLoopThread)
{
    EventLoop::Ptr loop(new EventLoop([](EventLoop &l)
                                      { return Service::Ptr(new FakeService(l)); }));
    loop->ensure_started();

    EXPECT_TRUE(loop->call([&loop]()
                           { return &loop->service() != nullptr; }));
    EXPECT_DEBUG_DEATH(loop->service(), "NOT_ON_LOOP_THREAD");
}

TEST(EventLoop, ServiceCallOffLoopThreadIsDefect)
{
    FakeService *fake = nullptr;
    EventLoop::Ptr loop(new EventLoop([&fake](EventLoop &l)
                                      {
        fake = new FakeService(l);
        return Service::Ptr(fake); }));
    loop->ensure_started();

    EXPECT_DEBUG_DEATH(fake->get_connections(), "NOT_ON_LOOP_THREAD");
}

TEST(EventLoop, ServiceReleasedOnLoopThread)
{
    class Tracked : public FakeService
    {
      public:
        Tracked(EventLoop &loop, std::promise<bool> &done)
            : FakeService(loop),
              loop_(loop),
              done_(done)
        {
        }

        ~Tracked()
        {
            done_.set_value(loop_.on_loop_thread());
        }

      private:
        EventLoop &loop_;
        std::promise<bool> &done_;
    };

    std::promise<bool> destroyed_on_loop;
    {
        EventLoop::Ptr loop(new EventLoop([&destroyed_on_loop](EventLoop &l)
                                          { return Service::Ptr(new Tracked(l, destroyed_on_loop)); }));
        loop->ensure_started();
    }
    EXPECT_TRUE(destroyed_on_loop.get_future().get());
}
