/**
 * @file TestModernBackend.cpp
 * @brief Unit tests for ModernHostapdBackend against an in-process service.
 */

#include <catch2/catch_test_macros.hpp>

#include "aphal/hostapd/ModernHostapdBackend.hpp"
#include "aphal/testing/CapturingLogger.hpp"
#include "aphal/testing/FakeServices.hpp"

#include <sstream>

using namespace aphal;
using namespace aphal::hostapd;

namespace {

struct Fixture
{
    testing::RegistryScope      registry;
    concurrency::EventLoop      loop{"modern-test"};
    std::shared_ptr<HalContext> context =
        std::make_shared<HalContext>(loop, HalConfig::Builder{}.build());
    std::unique_ptr<ModernHostapdBackend> backend =
        std::make_unique<ModernHostapdBackend>(context);

    template <typename F>
    auto locked(F&& f)
    {
        std::lock_guard<std::mutex> lock{context->lock};
        return f(*backend);
    }

    ~Fixture()
    {
        loop.shutdown();
        std::lock_guard<std::mutex> lock{context->lock};
        backend.reset();
    }
};

} // namespace

TEST_CASE_METHOD(Fixture, "Initialize fails when the service is not running",
                 "[hostapd][modern]")
{
    rpc::ServiceManager::instance().declare(IHostapdService::kServiceName);
    REQUIRE(ModernHostapdBackend::serviceDeclared());

    auto result = locked([](auto& b) { return b.initialize(); });
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kServiceUnavailable);
    REQUIRE_FALSE(backend->isInitializationComplete());
}

TEST_CASE_METHOD(Fixture, "Initialize links death and registers the event sink",
                 "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();

    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());
    REQUIRE(backend->isInitializationStarted());
    REQUIRE(backend->isInitializationComplete());
    REQUIRE(backend->supportsEventCallback());
    REQUIRE(service->registerCallbackCalls == 1);
    REQUIRE(service->linkCount() == 1);
    REQUIRE(service->lastDebugLevel == DebugLevel::kInfo);
}

TEST_CASE_METHOD(Fixture, "Verbose HAL logging raises the daemon debug level",
                 "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());

    locked([this](auto& b) {
        context->halVerboseLogging = true;
        b.enableVerboseLogging(true, true);
        return 0;
    });
    REQUIRE(service->lastDebugLevel == DebugLevel::kDebug);
}

TEST_CASE_METHOD(Fixture, "startAccessPoint sends prepared parameters", "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());

    int failures = 0;
    auto started = locked([&](auto& b) {
        return b.startAccessPoint("wlan1", testing::makeSoftApConfig(), true,
                                  [&failures] { ++failures; });
    });
    REQUIRE(started.has_value());
    REQUIRE(service->addCalls == 1);
    REQUIRE(service->lastIface.name == "wlan1");
    REQUIRE(service->lastNetwork.isMetered);
    REQUIRE(service->lastNetwork.encryptionType == EncryptionType::kWpa2);

    service->callback->onFailure("wlan1", "");
    testing::drain(loop);
    REQUIRE(failures == 1);
}

TEST_CASE_METHOD(Fixture, "Invalid configuration never reaches the daemon", "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());

    auto config = testing::makeSoftApConfig();
    config.ssid.clear();
    auto started = locked([&](auto& b) { return b.startAccessPoint("wlan1", config, false, {}); });

    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(service->addCalls == 0);
}

TEST_CASE_METHOD(Fixture, "Rejected start keeps no failure listener", "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());
    service->rejectCalls = true;

    int failures = 0;
    auto started = locked([&](auto& b) {
        return b.startAccessPoint("wlan1", testing::makeSoftApConfig(), false,
                                  [&failures] { ++failures; });
    });
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code() == core::ErrorCode::kBackendRejected);

    service->callback->onFailure("wlan1", "");
    testing::drain(loop);
    REQUIRE(failures == 0);
}

TEST_CASE_METHOD(Fixture, "stopAccessPoint drops the failure listener", "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());

    int failures = 0;
    REQUIRE(locked([&](auto& b) {
        return b.startAccessPoint("wlan1", testing::makeSoftApConfig(), false,
                                  [&failures] { ++failures; });
    }).has_value());
    REQUIRE(locked([](auto& b) { return b.stopAccessPoint("wlan1"); }).has_value());
    REQUIRE(service->lastRemoved == "wlan1");

    service->callback->onFailure("wlan1", "");
    testing::drain(loop);
    REQUIRE(failures == 0);
}

TEST_CASE_METHOD(Fixture, "disconnectClient maps the reason code", "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());

    const auto mac = MacAddress::fromString("02:00:00:00:00:01").value();
    REQUIRE(locked([&](auto& b) {
        return b.disconnectClient("wlan1", mac, DisconnectReason::kNoMoreStas);
    }).has_value());

    REQUIRE(service->lastClient == mac);
    REQUIRE(service->lastReason == Ieee80211ReasonCode::kDisassocApBusy);
}

TEST_CASE_METHOD(Fixture, "Operations without a service are refused", "[hostapd][modern]")
{
    testing::CapturingLogger logger;

    auto stopped = locked([](auto& b) { return b.stopAccessPoint("wlan1"); });
    REQUIRE_FALSE(stopped.has_value());
    REQUIRE(stopped.error().code() == core::ErrorCode::kServiceUnavailable);
    REQUIRE(logger.contains(core::LogLevel::kError, "Cannot call removeAccessPoint"));
}

TEST_CASE_METHOD(Fixture, "Service death tears down and calls the handler", "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());

    std::vector<core::u64> deaths;
    REQUIRE(locked([&](auto& b) {
        return b.registerDeathHandler([&deaths](core::u64 c) { deaths.push_back(c); });
    }).has_value());

    service->die();
    testing::drain(loop);

    REQUIRE(deaths.size() == 1);
    REQUIRE_FALSE(backend->isInitializationComplete());
    REQUIRE_FALSE(locked([](auto& b) { return b.stopAccessPoint("wlan1"); }).has_value());
}

TEST_CASE_METHOD(Fixture, "terminate is silent and idempotent", "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());

    int deaths = 0;
    REQUIRE(locked([&](auto& b) {
        return b.registerDeathHandler([&deaths](core::u64) { ++deaths; });
    }).has_value());

    locked([](auto& b) { b.terminate(); b.terminate(); return 0; });
    REQUIRE(service->terminateCalls == 1);
    REQUIRE(service->linkCount() == 0);

    service->die();
    testing::drain(loop);
    REQUIRE(deaths == 0);
}

TEST_CASE_METHOD(Fixture, "dump reports the link state", "[hostapd][modern]")
{
    auto service = testing::FakeHostapdService::publish();
    REQUIRE(locked([](auto& b) { return b.initialize(); }).has_value());

    std::ostringstream out;
    backend->dump(out);
    REQUIRE(out.str().find("service held: true") != std::string::npos);
    REQUIRE(out.str().find("death link: Linked") != std::string::npos);
}
