#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "mocks/mock_light_client.hpp"
#include "mocks/mock_service_browser.hpp"
#include "runtime/session.hpp"

using namespace keylight;
using namespace keylight::tests;
using namespace testing;
using keylight::device::DeviceEndpoint;
using keylight::device::LightState;

class SessionTest : public Test {
protected:
    void SetUp() override {
        browser = std::make_shared<NiceMock<MockServiceBrowser>>();
        browser->capture_on_start();
        client = std::make_shared<StrictMock<MockLightClient>>();
        config.discovery.timeout_ms = 100;
    }

    runtime::KeylightConfig config;
    std::shared_ptr<NiceMock<MockServiceBrowser>> browser;
    std::shared_ptr<StrictMock<MockLightClient>> client;
};

TEST_F(SessionTest, StaticDiscoveryThenToggle) {
    config.discovery.addresses = "192.168.1.10";
    DeviceEndpoint endpoint("192.168.1.10", device::kDefaultLightPort);

    LightState state;
    state.on = true;
    EXPECT_CALL(*client, fetch_state(endpoint, _, _)).WillOnce(DoAll(SetArgReferee<1>(state), Return(true)));
    EXPECT_CALL(*client, push_state(endpoint, _, _)).WillOnce(Return(true));

    runtime::Session session(config, browser, client);
    auto result = session.discover_and_execute(control::Operation::TOGGLE);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(control::describe_result(result), "Key Light turned off");
    EXPECT_EQ(session.get_registry().device_count(), 1u);
}

TEST_F(SessionTest, DiscoveryFailureSkipsControl) {
    runtime::Session session(config, browser, client);
    auto result = session.discover_and_execute(control::Operation::INCREASE_BRIGHTNESS);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::NO_DEVICES_FOUND);
    EXPECT_EQ(error_code_to_string(result.code), "NO_DEVICES_FOUND");
    EXPECT_EQ(result.error_message, "Cannot discover any Key Lights in the network");
}

TEST_F(SessionTest, SessionsHaveIndependentRegistries) {
    config.discovery.addresses = "192.168.1.10,192.168.1.11";
    runtime::Session first(config, browser, client);

    runtime::KeylightConfig other = config;
    other.discovery.addresses = "192.168.1.12";
    runtime::Session second(other, browser, client);

    ASSERT_TRUE(first.discover().success);
    ASSERT_TRUE(second.discover().success);

    EXPECT_EQ(first.get_registry().device_count(), 2u);
    EXPECT_EQ(second.get_registry().device_count(), 1u);
}
