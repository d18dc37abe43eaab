/**
 * @file test_targeted_discovery.cpp
 * @brief TargetedDiscoveryService 서술자 / 필터 / 데드라인 테스트
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Discovery/Adapters/ReplayDiscoveryAdapter.h"
#include "Discovery/TargetedDiscoveryService.h"
#include "Logging/LogManager.h"
#include "DiscoveryTestHelpers.h"

using namespace HomeLens::Discovery;
using namespace HomeLens::Discovery::Testing;
using namespace std::chrono_literals;
using HomeLens::Enums::ServiceDescriptorType;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;

class TargetedDiscoveryTest : public ::testing::Test {
protected:
    std::shared_ptr<DiscoveryAdapterRegistry> adapters;
    std::shared_ptr<DevicePatternRegistry> patterns;
    DiscoveryConfig config;

    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setFileOutput(false);

        adapters = std::make_shared<DiscoveryAdapterRegistry>();
        patterns = DevicePatternRegistry::CreateDefault();
        config.discovery_timeout = 2s;

        adapters->RegisterAdapter(std::make_shared<ReplayDiscoveryAdapter>(
            "mdns", std::vector<RawDeviceRecord>{
                        {{"id", "hue-1"}, {"ip", "10.0.0.5"}, {"name", "Philips Hue - 1A2B3C"},
                         {"service_type", "_hue._tcp.local."}},
                        {{"id", "cast-1"}, {"ip", "10.0.0.7"}, {"name", "Living Room TV"},
                         {"service_type", "_googlecast._tcp.local."}}}));
        adapters->RegisterAdapter(std::make_shared<ReplayDiscoveryAdapter>(
            "upnp", std::vector<RawDeviceRecord>{
                        {{"id", "uuid:2f402f80"}, {"ip", "10.0.0.5"}, {"manufacturer", "Signify (Philips)"},
                         {"deviceType", "urn:philips-com:device:bridge"}}}));
        adapters->RegisterAdapter(std::make_shared<ReplayDiscoveryAdapter>(
            "dhcp", std::vector<RawDeviceRecord>{
                        {{"id", "lease-5"}, {"ip", "10.0.0.5"}, {"vendor", "Philips Lighting"},
                         {"open_ports", {80, 443}}},
                        {{"id", "lease-9"}, {"ip", "10.0.0.9"}, {"vendor", "Sonos"},
                         {"open_ports", {80, 1400}}}}));
    }
};

TEST_F(TargetedDiscoveryTest, BuildDescriptors_FollowsPatternHints) {
    auto hue = TargetedDiscoveryService::BuildDescriptors(*patterns->GetPattern("hue"));
    ASSERT_EQ(hue.size(), 3u);
    EXPECT_EQ(hue[0].type, ServiceDescriptorType::MDNS_SERVICE);
    EXPECT_EQ(hue[0].value, "_hue._tcp.local.");
    EXPECT_EQ(hue[1].type, ServiceDescriptorType::UPNP_DEVICE_TYPE);
    EXPECT_EQ(hue[2].ports, (std::vector<int>{80, 443, 1900}));

    EXPECT_TRUE(TargetedDiscoveryService::BuildDescriptors(*patterns->GetPattern("nest")).empty());
    EXPECT_EQ(TargetedDiscoveryService::PreferredProtocol(hue[2]), "dhcp");
}

TEST_F(TargetedDiscoveryTest, DeviceMatchesPattern_KeywordContainment) {
    auto hue = *patterns->GetPattern("hue");
    EXPECT_TRUE(TargetedDiscoveryService::DeviceMatchesPattern(json{{"name", "PHILIPS hue"}}, hue));
    EXPECT_FALSE(TargetedDiscoveryService::DeviceMatchesPattern(json{{"name", "Bridge"}}, hue));

    DevicePattern model_only;
    model_only.model_keywords = {"tradfri"};
    EXPECT_TRUE(TargetedDiscoveryService::DeviceMatchesPattern(json{{"model", "TRADFRI gateway"}}, model_only));
    EXPECT_FALSE(TargetedDiscoveryService::DeviceMatchesPattern(json{{"model", "gateway"}}, model_only));

    DevicePattern no_keywords;
    EXPECT_TRUE(TargetedDiscoveryService::DeviceMatchesPattern(json{{"name", "anything"}}, no_keywords));
}

TEST_F(TargetedDiscoveryTest, DiscoverForIntegration_RunsAndFilters) {
    TargetedDiscoveryService service(config, adapters, patterns);
    auto devices = service.DiscoverForIntegration("hue");

    // cast-1 은 서비스 불일치, lease-9 는 포트는 맞지만 제조사 키워드 불일치
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].device.device_id, "hue-1");
    EXPECT_EQ(devices[0].device.discovery_method, "mdns");
    EXPECT_EQ(devices[1].device.discovery_method, "upnp");
    EXPECT_EQ(devices[2].device.device_id, "lease-5");
    ASSERT_TRUE(devices[0].pattern_match.has_value());
    EXPECT_EQ(devices[0].pattern_match->pattern_id, "hue");
    EXPECT_EQ(devices[2].correlation_key, "ip_10.0.0.5");
}

TEST_F(TargetedDiscoveryTest, UnknownPattern_ReturnsEmpty) {
    TargetedDiscoveryService service(config, adapters, patterns);
    EXPECT_TRUE(service.DiscoverForIntegration("no-such-integration").empty());
    // 클라우드 전용 패턴은 로컬 탐색 대상이 없다
    EXPECT_TRUE(service.DiscoverForIntegration("nest").empty());
}

TEST_F(TargetedDiscoveryTest, Deadline_KeepsCompletedScans) {
    auto slow_upnp = std::make_shared<::testing::NiceMock<MockDiscoveryAdapter>>();
    ON_CALL(*slow_upnp, SupportsService(_)).WillByDefault(Return(true));
    ON_CALL(*slow_upnp, DiscoverService(_, _))
        .WillByDefault([](const ServiceDescriptor&, const CancellationToken& token) {
            token.WaitFor(10s);
            return std::vector<RawDeviceRecord>{{{"name", "Hue Bridge"}, {"manufacturer", "Philips"}}};
        });
    EXPECT_CALL(*slow_upnp,
                DiscoverService(Field(&ServiceDescriptor::type, ServiceDescriptorType::UPNP_DEVICE_TYPE), _))
        .Times(1);
    adapters->RegisterAdapter("upnp", slow_upnp);

    TargetedDiscoveryService service(config, adapters, patterns);
    auto started = std::chrono::steady_clock::now();
    auto devices = service.DiscoverForIntegration("hue", 400ms);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, 1000ms);
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].device.discovery_method, "mdns");
    EXPECT_EQ(devices[1].device.discovery_method, "dhcp");
}
