/**
 * @file TestServiceManager.cpp
 * @brief Unit tests for aphal::rpc::ServiceManager.
 */

#include <catch2/catch_test_macros.hpp>

#include "aphal/rpc/LocalBinder.hpp"
#include "aphal/rpc/ServiceManager.hpp"

#include <algorithm>

using namespace aphal;

namespace {

struct DummyService final : rpc::IInterface
{
    std::shared_ptr<rpc::IBinder> asBinder() override { return binder; }

    std::shared_ptr<rpc::LocalBinder> binder = std::make_shared<rpc::LocalBinder>("test.IDummy");
};

} // namespace

TEST_CASE("ServiceManager separates declared from running", "[rpc][servicemanager]")
{
    rpc::ServiceManager manager;

    REQUIRE_FALSE(manager.isDeclared("svc"));

    manager.declare("svc");
    REQUIRE(manager.isDeclared("svc"));
    REQUIRE(manager.getService("svc") == nullptr);

    auto service = std::make_shared<DummyService>();
    manager.addService("svc", service);
    REQUIRE(manager.getService<DummyService>("svc") == service);

    manager.removeService("svc");
    REQUIRE(manager.isDeclared("svc"));
    REQUIRE(manager.getService("svc") == nullptr);
}

TEST_CASE("ServiceManager notifies on registration", "[rpc][servicemanager]")
{
    rpc::ServiceManager manager;
    int notified = 0;

    const auto token = manager.registerForNotifications(
        "svc", [&notified](const std::shared_ptr<rpc::IInterface>& service) {
            if (service)
                ++notified;
        });
    REQUIRE(notified == 0);

    manager.addService("svc", std::make_shared<DummyService>());
    REQUIRE(notified == 1);

    manager.addService("other", std::make_shared<DummyService>());
    REQUIRE(notified == 1);

    manager.unregisterForNotifications(token);
    manager.addService("svc", std::make_shared<DummyService>());
    REQUIRE(notified == 1);
}

TEST_CASE("ServiceManager reports an already running service immediately",
          "[rpc][servicemanager]")
{
    rpc::ServiceManager manager;
    manager.addService("svc", std::make_shared<DummyService>());

    int notified = 0;
    const auto token = manager.registerForNotifications(
        "svc", [&notified](const std::shared_ptr<rpc::IInterface>&) { ++notified; });

    REQUIRE(notified == 1);
    manager.unregisterForNotifications(token);
}

TEST_CASE("ServiceManager reset forgets everything", "[rpc][servicemanager]")
{
    rpc::ServiceManager manager;
    manager.declare("a");
    manager.addService("b", std::make_shared<DummyService>());

    auto names = manager.declaredServices();
    REQUIRE(names.size() == 2);
    REQUIRE(std::find(names.begin(), names.end(), "a") != names.end());

    manager.reset();
    REQUIRE(manager.declaredServices().empty());
    REQUIRE_FALSE(manager.isDeclared("b"));
}
