// tests/test_RouterDevice.cpp
#include <gtest/gtest.h>
#include "RouterDevice.hpp"
#include <QCoreApplication>
#include <memory>

namespace router_monitor {
namespace testing {

class RouterDeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        app = std::make_unique<QCoreApplication>(argc, argv);
        RouterSettings settings;
        settings.name = "core";
        settings.address = "10.0.0.1";
        settings.port = 8728;
        device = std::make_unique<RouterDevice>(settings);
    }

    void TearDown() override {
        device.reset();
        app.reset();
    }

    int argc{1};
    char appName[5] = "test";
    char* argv[1] = {appName};
    std::unique_ptr<QCoreApplication> app;
    std::unique_ptr<RouterDevice> device;
};

TEST_F(RouterDeviceTest, GeneratesIdWhenMissing) {
    EXPECT_FALSE(device->id().empty());
    EXPECT_EQ(device->settings().id, device->id());

    RouterDevice other{RouterSettings()};
    EXPECT_NE(other.id(), device->id());
    EXPECT_NE(*device, other);
}

TEST_F(RouterDeviceTest, EqualityFollowsIdentity) {
    RouterSettings a;
    a.id = "router-7";
    a.name = "first";
    RouterSettings b = a;
    b.name = "second";

    RouterDevice first(a);
    RouterDevice second(b);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.id(), "router-7");
}

TEST_F(RouterDeviceTest, StartsDisconnected) {
    EXPECT_EQ(device->connectionState(), ConnectionState::Disconnected);
    EXPECT_FALSE(device->isConnected());
    EXPECT_EQ(device->connectionStatusText(), "Disconnected");
    EXPECT_EQ(device->name(), "core");
    EXPECT_EQ(device->address(), "10.0.0.1");
    EXPECT_EQ(device->port(), 8728);
}

TEST_F(RouterDeviceTest, StatusTextCarriesFailureReason) {
    device->setConnectionState(ConnectionState::Connecting);
    EXPECT_EQ(device->connectionStatusText(), "Connecting");

    device->setConnectionState(ConnectionState::Failed, "Timeout");
    EXPECT_EQ(device->connectionStatusText(), "Timeout");
    EXPECT_EQ(device->failureReason(), "Timeout");

    device->setConnectionState(ConnectionState::Failed);
    EXPECT_EQ(device->connectionStatusText(), "Failed");

    device->setConnectionState(ConnectionState::Connected, "ignored");
    EXPECT_TRUE(device->isConnected());
    EXPECT_EQ(device->failureReason(), "");
}

TEST_F(RouterDeviceTest, StateSignalFiresOnlyOnChange) {
    std::vector<ConnectionState> seen;
    QObject::connect(device.get(), &RouterDevice::connectionStateChanged,
        [&seen](ConnectionState state) {
            seen.push_back(state);
        });

    device->setConnectionState(ConnectionState::Connecting);
    device->setConnectionState(ConnectionState::Connecting);
    device->setConnectionState(ConnectionState::Connected);
    device->setConnectionState(ConnectionState::Connected);

    EXPECT_EQ(seen, (std::vector<ConnectionState>{
        ConnectionState::Connecting, ConnectionState::Connected}));
}

TEST_F(RouterDeviceTest, SetSettingsKeepsIdentity) {
    const std::string id = device->id();
    int changes = 0;
    QObject::connect(device.get(), &RouterDevice::settingsChanged,
        [&changes]() { ++changes; });

    RouterSettings updated;
    updated.id = "something-else";
    updated.name = "edge";
    updated.address = "10.0.0.2";
    device->setSettings(updated);

    EXPECT_EQ(device->id(), id);
    EXPECT_EQ(device->settings().id, id);
    EXPECT_EQ(device->name(), "edge");
    EXPECT_EQ(changes, 1);
}

TEST_F(RouterDeviceTest, DataSettersNotify) {
    int updates = 0;
    QObject::connect(device.get(), &RouterDevice::dataUpdated,
        [&updates]() { ++updates; });

    SystemInfo info;
    info.identity = "MikroTik";
    device->setSystemInfo(info);
    device->setDhcpLeases({DhcpLease(), DhcpLease()});

    EXPECT_EQ(updates, 2);
    EXPECT_EQ(device->systemInfo().identity, "MikroTik");
    EXPECT_EQ(device->dhcpLeases().size(), 2u);
    EXPECT_TRUE(device->networkInterfaces().empty());
}

} // namespace testing
} // namespace router_monitor
