//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

#include "test_common.hpp"
#include "fake_service.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <pianm/common/jsonhelper.hpp>
#include <pianm/nm/client.hpp>
#include <pianm/nm/loop.hpp>
#include <pianm/nm/refresh.hpp>

using namespace pianm;
using namespace pianm::test;
using namespace std::chrono_literals;

namespace {

SettingsMap saved_profile(const std::string &id, const std::string &uuid)
{
    SettingsMap s(Json::objectValue);
    s[Setting::CONNECTION]["id"] = id;
    s[Setting::CONNECTION]["uuid"] = uuid;
    s[Setting::CONNECTION]["type"] = "wireguard";
    s[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY] = "old";
    Json::Value peer(Json::objectValue);
    peer[Setting::WG_PEER_ENDPOINT] = "1.2.3.4:1337";
    peer[Setting::WG_PEER_PUBLIC_KEY] = "srv";
    s[Setting::WIREGUARD][Setting::WG_PEERS].append(peer);
    return s;
}

RefreshRequest request(const std::string &id)
{
    RefreshRequest req;
    req.resource_id = id;
    req.private_key = "new";
    req.peer_endpoint = "5.6.7.8:1337";
    return req;
}

class RefreshTest : public testing::Test
{
  protected:
    void SetUp() override
    {
        loop.reset(new EventLoop([this](EventLoop &l)
                                 {
            fake = new FakeService(l);
            return Service::Ptr(fake); }));
        loop->ensure_started();
        client.reset(new ConnectionClient(*loop, 300ms));
        engine.reset(new RefreshEngine(*client, 3));
        testLog->startCollecting();
    }

    void TearDown() override
    {
        testLog->stopCollecting();
        EXPECT_EQ(fake->wrong_thread_calls(), 0u);
        engine.reset();
        client.reset();
    }

    // An active connection whose device reports the saved settings at
    // version_id.
    FakeDevice::Ptr make_active(const FakeConnection::Ptr &c, const std::uint64_t version_id)
    {
        FakeDevice::Ptr d(new FakeDevice(*fake, "wg-1a2b3c4d"));
        d->set_applied(c->saved(), version_id);
        fake->activate_on(c, {d});
        return d;
    }

    EventLoop::Ptr loop;
    FakeService *fake = nullptr;
    std::unique_ptr<ConnectionClient> client;
    std::unique_ptr<RefreshEngine> engine;
};

} // namespace

TEST_F(RefreshTest, ActiveConnectionReappliedInPlace)
{
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    SettingsMap snapshot(Json::objectValue);
    snapshot[Setting::WIREGUARD] = c->saved()[Setting::WIREGUARD];
    FakeDevice::Ptr d(new FakeDevice(*fake, "wg-1a2b3c4d"));
    d->set_applied(snapshot, 7);
    fake->activate_on(c, {d});
    fake->clear_calls();

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_TRUE(st.ok()) << st.message;
    EXPECT_TRUE(st.live);
    EXPECT_EQ(st.attempts, 1u);

    const std::vector<std::string> expected{OP_GET_APPLIED, OP_REAPPLY};
    EXPECT_EQ(fake->calls(), expected);

    ASSERT_EQ(d->reapplied().size(), 1u);
    EXPECT_EQ(d->reapply_versions(), std::vector<std::uint64_t>{7});
    const Json::Value want = json::parse(R"({"wireguard":{"private-key":"new","peers":[{"endpoint":"5.6.7.8:1337","public-key":"srv"}]}})",
                                         "expected");
    EXPECT_EQ(d->reapplied()[0], want);

    // the saved profile is left for the next activation to pick up
    EXPECT_EQ(c->saved()[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "old");
}

TEST_F(RefreshTest, InactiveConnectionUpdatesSavedProfile)
{
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_TRUE(st.ok()) << st.message;
    EXPECT_FALSE(st.live);

    EXPECT_EQ(fake->count(OP_REAPPLY), 0u);
    EXPECT_EQ(fake->count(OP_GET_APPLIED), 0u);
    EXPECT_EQ(fake->count(OP_UPDATE2), 1u);
    EXPECT_EQ(fake->count(OP_DELETE), 0u);
    EXPECT_EQ(fake->count(OP_ADD), 0u);
    for (const auto &l : fake->lookups())
        EXPECT_NE(l, "devices");

    const SettingsMap saved = c->saved();
    EXPECT_EQ(saved[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "new");
    EXPECT_EQ(saved[Setting::WIREGUARD][Setting::WG_PEERS][0][Setting::WG_PEER_ENDPOINT].asString(), "5.6.7.8:1337");
    EXPECT_EQ(saved[Setting::CONNECTION]["uuid"].asString(), "uuid-1");
    EXPECT_EQ(c->last_update_flags(), static_cast<std::uint32_t>(UPDATE2_FLAG_NONE));
}

TEST_F(RefreshTest, UnreadableSnapshotIsNotReapplied)
{
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    make_active(c, 1);

    Fault f;
    f.null_result = true;
    fake->inject(OP_GET_APPLIED, f);

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_FALSE(st.ok());
    EXPECT_EQ(st.error, Error::SNAPSHOT_UNAVAILABLE);
    EXPECT_EQ(fake->count(OP_REAPPLY), 0u);
    EXPECT_EQ(fake->count(OP_UPDATE2), 0u);
}

TEST_F(RefreshTest, ActiveWithoutDevice)
{
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    fake->activate_on(c, {});

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_EQ(st.error, Error::DEVICE_NOT_FOUND);
    EXPECT_TRUE(fake->calls().empty());
}

TEST_F(RefreshTest, ActiveCopyWithSameIdIsNotMistaken)
{
    // two profiles share the id; only the second one is up
    FakeConnection::Ptr idle = fake->add_saved(saved_profile("PIA-X", "uuid-1"));
    FakeConnection::Ptr up = fake->add_saved(saved_profile("PIA-X", "uuid-2"));
    FakeDevice::Ptr d = make_active(up, 1);
    fake->clear_calls();

    const RefreshStatus st = engine->refresh(request("PIA-X"));
    EXPECT_TRUE(st.ok()) << st.message;
    EXPECT_FALSE(st.live);
    EXPECT_EQ(fake->count(OP_UPDATE2), 1u);
    EXPECT_EQ(fake->count(OP_REAPPLY), 0u);

    EXPECT_EQ(idle->saved()[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "new");
    EXPECT_EQ(up->saved()[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "old");
    EXPECT_EQ(d->applied()[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "old");

    EXPECT_FALSE(client->get_active(client->get_by_id("PIA-X")));
    EXPECT_TRUE(client->get_active("PIA-X"));
}

TEST_F(RefreshTest, AppliedStateWithoutWireguardIsNotRetried)
{
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    FakeDevice::Ptr d = make_active(c, 1);
    SettingsMap applied = c->saved();
    applied.removeMember(Setting::WIREGUARD);
    d->set_applied(applied, 1);

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_EQ(st.error, Error::MISSING_CONFIG_SECTION);
    EXPECT_EQ(st.attempts, 1u);
    EXPECT_EQ(fake->count(OP_GET_APPLIED), 1u);
    EXPECT_EQ(fake->count(OP_REAPPLY), 0u);
    EXPECT_EQ(fake->count(OP_UPDATE2), 0u);
}

TEST_F(RefreshTest, ReapplyTimeoutIsRetried)
{
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    FakeDevice::Ptr d = make_active(c, 3);
    Fault hang;
    hang.hang = true;
    fake->inject(OP_REAPPLY, hang);

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_TRUE(st.ok()) << st.message;
    EXPECT_TRUE(st.live);
    EXPECT_EQ(st.attempts, 2u);
    EXPECT_EQ(fake->count(OP_GET_APPLIED), 2u);
    EXPECT_EQ(fake->count(OP_REAPPLY), 2u);
    EXPECT_EQ(d->reapply_versions(), std::vector<std::uint64_t>{3});
    EXPECT_EQ(d->applied()[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "new");
}

TEST_F(RefreshTest, MissingPeerIsReported)
{
    SettingsMap s = saved_profile("PIA-US-East", "uuid-1");
    s[Setting::WIREGUARD].removeMember(Setting::WG_PEERS);
    FakeConnection::Ptr c = fake->add_saved(s);

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_TRUE(st.ok()) << st.message;
    EXPECT_FALSE(st.endpoint_applied);
    EXPECT_NE(st.message.find("5.6.7.8:1337"), std::string::npos) << st.message;
    EXPECT_EQ(c->saved()[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "new");

    fake->add_saved(saved_profile("PIA-DE-Berlin", "uuid-2"));
    const RefreshStatus full = engine->refresh(request("PIA-DE-Berlin"));
    EXPECT_TRUE(full.endpoint_applied);
    EXPECT_TRUE(full.message.empty());
}

TEST_F(RefreshTest, StaleVersionIsRetried)
{
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    FakeDevice::Ptr d = make_active(c, 4);
    d->race_next_reads(1);

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_TRUE(st.ok()) << st.message;
    EXPECT_TRUE(st.live);
    EXPECT_EQ(st.attempts, 2u);

    // the first reapply carried the version read before the change
    EXPECT_EQ(d->reapply_versions(), (std::vector<std::uint64_t>{4, 5}));
    EXPECT_EQ(d->applied()[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "new");
}

TEST_F(RefreshTest, StaleVersionGivesUpAfterAttempts)
{
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    FakeDevice::Ptr d = make_active(c, 1);
    d->race_next_reads(100);

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_EQ(st.error, Error::REAPPLY_FAILED);
    EXPECT_FALSE(st.live);
    EXPECT_EQ(st.attempts, 3u);
    EXPECT_EQ(fake->count(OP_REAPPLY), 3u);
    EXPECT_EQ(fake->count(OP_UPDATE2), 0u);
    EXPECT_EQ(fake->count(OP_DELETE), 0u);
    EXPECT_TRUE(d->reapplied().empty());
}

TEST_F(RefreshTest, SingleAttemptEngine)
{
    RefreshEngine once(*client, 0);
    FakeConnection::Ptr c = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    FakeDevice::Ptr d = make_active(c, 1);
    d->race_next_reads(1);

    const RefreshStatus st = once.refresh(request("PIA-US-East"));
    EXPECT_EQ(st.error, Error::REAPPLY_FAILED);
    EXPECT_EQ(st.attempts, 1u);
}

TEST_F(RefreshTest, UnknownConnection)
{
    const RefreshStatus st = engine->refresh(request("PIA-Nowhere"));
    EXPECT_EQ(st.error, Error::CONNECTION_NOT_FOUND);
    EXPECT_NE(st.message.find("PIA-Nowhere"), std::string::npos);
    EXPECT_TRUE(fake->calls().empty());
}

TEST_F(RefreshTest, MissingWireguardSection)
{
    SettingsMap s = saved_profile("PIA-US-East", "uuid-1");
    s.removeMember(Setting::WIREGUARD);
    FakeConnection::Ptr c = fake->add_saved(s);

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_EQ(st.error, Error::MISSING_CONFIG_SECTION);
    EXPECT_EQ(fake->count(OP_UPDATE2), 0u);
}

TEST_F(RefreshTest, PermissionDeniedSuggestsRecreate)
{
    fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    fake->inject(OP_UPDATE2, Fault::service_error("nm-settings-error-quark", 1, "Insufficient privileges"));

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_EQ(st.error, Error::UPDATE_SAVED_FAILED);
    EXPECT_NE(st.message.find("recreate it"), std::string::npos) << st.message;
    EXPECT_NE(testLog->getOutput().find("permission denied"), std::string::npos);
}

TEST_F(RefreshTest, OtherSaveErrorHasNoHint)
{
    fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    fake->inject(OP_UPDATE2, Fault::service_error("nm-settings-error-quark", 4, "invalid property"));

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_EQ(st.error, Error::UPDATE_SAVED_FAILED);
    EXPECT_EQ(st.message.find("recreate it"), std::string::npos) << st.message;
}

TEST_F(RefreshTest, SaveTimeout)
{
    fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    Fault hang;
    hang.hang = true;
    fake->inject(OP_UPDATE2, hang);

    const RefreshStatus st = engine->refresh(request("PIA-US-East"));
    EXPECT_EQ(st.error, Error::OPERATION_TIMEOUT);
}

TEST_F(RefreshTest, BatchFailuresAreIsolated)
{
    FakeConnection::Ptr live = fake->add_saved(saved_profile("PIA-US-East", "uuid-1"));
    make_active(live, 1);
    FakeConnection::Ptr idle = fake->add_saved(saved_profile("PIA-DE-Berlin", "uuid-2"));

    const RefreshSummary summary = engine->refresh_all({request("PIA-US-East"),
                                                        request("PIA-Nowhere"),
                                                        request("PIA-DE-Berlin")});
    ASSERT_EQ(summary.results.size(), 3u);
    EXPECT_EQ(summary.successful, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.live, 1u);
    EXPECT_FALSE(summary.ok());

    EXPECT_TRUE(summary.results[0].live);
    EXPECT_EQ(summary.results[1].error, Error::CONNECTION_NOT_FOUND);
    EXPECT_FALSE(summary.results[2].live);
    EXPECT_EQ(idle->saved()[Setting::WIREGUARD][Setting::WG_PRIVATE_KEY].asString(), "new");
}

TEST(RefreshRequest, ListFromJson)
{
    const Json::Value root = json::parse(R"([
        {"id": "PIA-US-East", "private_key": "k1", "endpoint": "1.2.3.4:1337"},
        {"id": "PIA-DE-Berlin", "private_key": "k2", "endpoint": "5.6.7.8:1337"}
    ])",
                                         "targets");
    const std::vector<RefreshRequest> reqs = RefreshRequest::list_from_json(root, "targets");
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0].resource_id, "PIA-US-East");
    EXPECT_EQ(reqs[1].private_key, "k2");
    EXPECT_EQ(reqs[1].peer_endpoint, "5.6.7.8:1337");
}

TEST(RefreshRequest, ListFromJsonRejectsBadEntries)
{
    EXPECT_THROW(RefreshRequest::list_from_json(json::parse(R"({"id": "x"})", "t"), "t"), json::json_parse);
    EXPECT_THROW(RefreshRequest::list_from_json(json::parse(R"([{"id": "x", "private_key": "k"}])", "t"), "t"), json::json_parse);
    EXPECT_THROW(RefreshRequest::list_from_json(json::parse(R"([{"id": 3, "private_key": "k", "endpoint": "e"}])", "t"), "t"), json::json_parse);
}
