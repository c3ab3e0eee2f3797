/**
 * @file TestLegacyBackend.cpp
 * @brief Unit tests for LegacyHostapdBackend: lazy adoption and version gates.
 */

#include <catch2/catch_test_macros.hpp>

#include "aphal/hostapd/LegacyHostapdBackend.hpp"
#include "aphal/testing/FakeServices.hpp"

#include <sstream>

using namespace aphal;
using namespace aphal::hostapd;
using testing::FakeLegacyHostapdService;

namespace {

struct Fixture
{
    testing::RegistryScope      registry;
    concurrency::EventLoop      loop{"legacy-test"};
    std::shared_ptr<HalContext> context =
        std::make_shared<HalContext>(loop, HalConfig::Builder{}.build());
    std::unique_ptr<LegacyHostapdBackend> backend =
        std::make_unique<LegacyHostapdBackend>(context);

    template <typename F>
    auto locked(F&& f)
    {
        std::lock_guard<std::mutex> lock{context->lock};
        return f(*backend);
    }

    void initialize()
    {
        REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());
        testing::drain(loop);
    }

    ~Fixture()
    {
        loop.shutdown();
        std::lock_guard<std::mutex> lock{context->lock};
        backend.reset();
    }
};

} // namespace

TEST_CASE_METHOD(Fixture, "A running service is adopted at initialize", "[hostapd][legacy]")
{
    auto service = FakeLegacyHostapdService::publish(LegacyVersion::kV1_3);
    initialize();

    REQUIRE(backend->isInitializationStarted());
    REQUIRE(backend->isInitializationComplete());
    REQUIRE(backend->serviceVersion() == LegacyVersion::kV1_3);
    REQUIRE(service->registerCallbackCalls == 1);
    REQUIRE(service->lastDebugLevel == DebugLevel::kInfo);
}

TEST_CASE_METHOD(Fixture, "A late registration is adopted on the event loop", "[hostapd][legacy]")
{
    initialize();
    REQUIRE(backend->isInitializationStarted());
    REQUIRE_FALSE(backend->isInitializationComplete());
    REQUIRE_FALSE(backend->serviceVersion().has_value());

    auto service = FakeLegacyHostapdService::publish(LegacyVersion::kV1_2);
    testing::drain(loop);

    REQUIRE(backend->isInitializationComplete());
    REQUIRE(backend->serviceVersion() == LegacyVersion::kV1_2);
}

TEST_CASE_METHOD(Fixture, "A second initialize is refused", "[hostapd][legacy]")
{
    initialize();
    auto again = locked([](auto& b) { return b.initialize(); });
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE_METHOD(Fixture, "Version 1.0 has no callbacks and no failure listeners",
                 "[hostapd][legacy]")
{
    auto service = FakeLegacyHostapdService::publish(LegacyVersion::kV1_0);
    initialize();

    REQUIRE(service->registerCallbackCalls == 0);
    REQUIRE(service->debugCalls == 0);
    REQUIRE_FALSE(backend->supportsEventCallback());

    auto callback = std::make_shared<testing::RecordingSoftApCallback>();
    auto registered = locked([&](auto& b) { return b.registerEventCallback("wlan1", callback); });
    REQUIRE_FALSE(registered.has_value());
    REQUIRE(registered.error().code() == core::ErrorCode::kNotSupported);

    REQUIRE(locked([](auto& b) {
        return b.startAccessPoint("wlan1", testing::makeSoftApConfig(), false, [] {});
    }).has_value());
    REQUIRE(service->addCalls == 1);

    std::ostringstream out;
    backend->dump(out);
    REQUIRE(out.str().find("tracked interfaces: 0") != std::string::npos);
}

TEST_CASE_METHOD(Fixture, "Client disconnect needs version 1.2", "[hostapd][legacy]")
{
    const auto mac = MacAddress::fromString("02:00:00:00:00:02").value();

    SECTION("1.1 is refused without a remote call")
    {
        auto service = FakeLegacyHostapdService::publish(LegacyVersion::kV1_1);
        initialize();

        auto result = locked([&](auto& b) {
            return b.disconnectClient("wlan1", mac, DisconnectReason::kBlockedByUser);
        });
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kNotSupported);
        REQUIRE(service->disconnectCalls == 0);
    }
    SECTION("1.2 forwards the mapped reason")
    {
        auto service = FakeLegacyHostapdService::publish(LegacyVersion::kV1_2);
        initialize();

        REQUIRE(locked([&](auto& b) {
            return b.disconnectClient("wlan1", mac, DisconnectReason::kBlockedByUser);
        }).has_value());
        REQUIRE(service->lastReason == Ieee80211ReasonCode::kPrevAuthNotValid);
    }
}

TEST_CASE_METHOD(Fixture, "Version 1.3 routes events to the registered callback",
                 "[hostapd][legacy]")
{
    auto service = FakeLegacyHostapdService::publish(LegacyVersion::kV1_3);
    initialize();
    REQUIRE(backend->supportsEventCallback());

    auto callback = std::make_shared<testing::RecordingSoftApCallback>();
    REQUIRE(locked([&](auto& b) { return b.registerEventCallback("wlan1", callback); }).has_value());

    ClientInfo client;
    client.ifaceName   = "wlan1";
    client.isConnected = true;
    service->callback->onConnectedClientsChanged(client);
    testing::drain(loop);

    REQUIRE(callback->clients.size() == 1);
}

TEST_CASE_METHOD(Fixture, "Daemon rejections become BackendRejected", "[hostapd][legacy]")
{
    auto service = FakeLegacyHostapdService::publish(LegacyVersion::kV1_1);
    initialize();
    service->rejectCalls = true;

    auto result = locked([](auto& b) { return b.stopAccessPoint("wlan1"); });
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kBackendRejected);
}

TEST_CASE_METHOD(Fixture, "Death is final: a new registration is not adopted",
                 "[hostapd][legacy]")
{
    auto service = FakeLegacyHostapdService::publish(LegacyVersion::kV1_3);
    initialize();

    int deaths = 0;
    REQUIRE(locked([&](auto& b) {
        return b.registerDeathHandler([&deaths](core::u64) { ++deaths; });
    }).has_value());

    service->die();
    testing::drain(loop);
    REQUIRE(deaths == 1);
    REQUIRE_FALSE(backend->isInitializationComplete());
    REQUIRE_FALSE(backend->isInitializationStarted());

    auto restarted = FakeLegacyHostapdService::publish(LegacyVersion::kV1_3);
    testing::drain(loop);
    REQUIRE_FALSE(backend->isInitializationComplete());
    REQUIRE(restarted->registerCallbackCalls == 0);
}

TEST_CASE_METHOD(Fixture, "startDaemon adopts a service that appeared", "[hostapd][legacy]")
{
    REQUIRE_FALSE(locked([](auto& b) { return b.startDaemon(); }).has_value());

    auto service = FakeLegacyHostapdService::create(LegacyVersion::kV1_2);
    rpc::ServiceManager::instance().addService(ILegacyHostapdService::kServiceName, service);

    REQUIRE(locked([](auto& b) { return b.startDaemon(); }).has_value());
    REQUIRE(backend->isInitializationComplete());
}
