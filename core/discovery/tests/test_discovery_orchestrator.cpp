/**
 * @file test_discovery_orchestrator.cpp
 * @brief DiscoveryOrchestrator 격리 / 데드라인 / 캐시 / 상세 조회 테스트
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Discovery/AutoDiscoveryService.h"
#include "Logging/LogManager.h"
#include "DiscoveryTestHelpers.h"

#include <chrono>

using namespace HomeLens::Discovery;
using namespace HomeLens::Discovery::Testing;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class DiscoveryOrchestratorTest : public ::testing::Test {
protected:
    std::shared_ptr<DiscoveryAdapterRegistry> adapters;
    std::shared_ptr<ScriptedAdapter> mdns;
    std::shared_ptr<ScriptedAdapter> upnp;
    std::shared_ptr<ScriptedAdapter> zigbee;
    DiscoveryConfig config;

    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setFileOutput(false);

        mdns = std::make_shared<ScriptedAdapter>(
            "mdns", std::vector<RawDeviceRecord>{
                        {{"id", "hue-mdns"}, {"ip", "10.0.0.5"}, {"name", "Bridge"},
                         {"service_type", "_hue._tcp.local."}}});
        upnp = std::make_shared<ScriptedAdapter>(
            "upnp", std::vector<RawDeviceRecord>{
                        {{"id", "hue-upnp"}, {"ip", "10.0.0.5"}, {"name", "Hue Bridge"},
                         {"manufacturer", "Philips"}, {"model", "BSB002"}},
                        {{"id", "sonos-upnp"}, {"ip", "10.0.0.9"}, {"name", "Kitchen"},
                         {"manufacturer", "Sonos"}, {"model", "One"}}});
        zigbee = std::make_shared<ScriptedAdapter>(
            "zigbee", std::vector<RawDeviceRecord>{{{"id", "0x00158d"}, {"name", "Motion Sensor"}}});

        adapters = std::make_shared<DiscoveryAdapterRegistry>();
        adapters->RegisterAdapter(mdns);
        adapters->RegisterAdapter(upnp);
        adapters->RegisterAdapter(zigbee);

        config.discovery_timeout = 2s;
        config.cache_duration = 300s;
        config.default_protocols = {"mdns", "upnp", "zigbee"};
    }

    std::unique_ptr<DiscoveryOrchestrator> MakeOrchestrator() {
        return std::make_unique<DiscoveryOrchestrator>(config, adapters, DevicePatternRegistry::CreateDefault());
    }
};

TEST_F(DiscoveryOrchestratorTest, DiscoverAll_RunsPipelineInRequestOrder) {
    auto orchestrator = MakeOrchestrator();
    auto results = orchestrator->DiscoverAll({"upnp", "mdns"});

    EXPECT_EQ(results.Protocols(), (std::vector<std::string>{"upnp", "mdns"}));
    ASSERT_EQ(results.At("upnp").size(), 2u);
    ASSERT_EQ(results.At("mdns").size(), 1u);

    // 같은 IP 의 mdns/upnp 는 상관되고 패턴까지 붙는다
    const auto& hue_mdns = results.At("mdns")[0];
    EXPECT_EQ(hue_mdns.correlation_key, "ip_10.0.0.5");
    EXPECT_EQ(hue_mdns.device.name, "Hue Bridge");
    EXPECT_EQ(hue_mdns.device.manufacturer.value_or(""), "Philips");
    EXPECT_EQ(hue_mdns.correlated_protocols, (std::vector<std::string>{"mdns", "upnp"}));
    ASSERT_TRUE(hue_mdns.pattern_match.has_value());
    EXPECT_EQ(hue_mdns.pattern_match->pattern_id, "hue");
    EXPECT_GT(hue_mdns.device.confidence_score, 0.3);

    // 어댑터 고유 순서 유지
    EXPECT_EQ(results.At("upnp")[0].device.device_id, "hue-upnp");
    EXPECT_EQ(results.At("upnp")[1].device.device_id, "sonos-upnp");
}

// 한 어댑터가 예외를 던져도 다른 항목은 그대로
TEST_F(DiscoveryOrchestratorTest, FailingAdapter_IsIsolated) {
    zigbee->SetFailure("ConnectionError: coordinator unreachable");
    auto orchestrator = MakeOrchestrator();

    auto results = orchestrator->DiscoverAll();
    ASSERT_TRUE(results.Contains("zigbee"));
    EXPECT_TRUE(results.At("zigbee").empty());
    EXPECT_EQ(results.At("mdns").size(), 1u);
    EXPECT_EQ(results.At("upnp").size(), 2u);

    auto outcomes = orchestrator->GetLastOutcomes();
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[2].status, HomeLens::Enums::AdapterStatus::FAILED);
    EXPECT_NE(outcomes[2].error_message.find("ConnectionError"), std::string::npos);
}

TEST_F(DiscoveryOrchestratorTest, MockAdapterThrowing_IsIsolated) {
    auto mock = std::make_shared<::testing::NiceMock<MockDiscoveryAdapter>>();
    EXPECT_CALL(*mock, Discover(_)).WillOnce(Throw(std::runtime_error("socket closed")));
    adapters->RegisterAdapter("bluetooth", mock);

    auto orchestrator = MakeOrchestrator();
    auto results = orchestrator->DiscoverAll({"bluetooth", "mdns"});
    EXPECT_TRUE(results.At("bluetooth").empty());
    EXPECT_EQ(results.At("mdns").size(), 1u);
}

// 2초 데드라인, 10초 걸리는 어댑터 -> 약 2초 안에 반환, 해당 항목은 빈 목록
TEST_F(DiscoveryOrchestratorTest, SlowAdapter_CutByGlobalDeadline) {
    zigbee->SetDelay(10s);
    auto orchestrator = MakeOrchestrator();

    auto started = std::chrono::steady_clock::now();
    auto results = orchestrator->DiscoverAll();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, 2500ms);
    EXPECT_GE(elapsed, 1900ms);
    EXPECT_TRUE(results.At("zigbee").empty()); // 취소 후 부분 결과 폐기
    EXPECT_EQ(results.At("mdns").size(), 1u);
    EXPECT_EQ(orchestrator->GetLastOutcomes()[2].status, HomeLens::Enums::AdapterStatus::TIMED_OUT);
}

TEST_F(DiscoveryOrchestratorTest, NonCooperativeAdapter_DoesNotBlockCaller) {
    config.discovery_timeout = 300ms;
    zigbee->SetDelay(1500ms, false);
    auto orchestrator = MakeOrchestrator();

    auto started = std::chrono::steady_clock::now();
    auto results = orchestrator->DiscoverAll();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, 800ms);
    EXPECT_TRUE(results.At("zigbee").empty());
    EXPECT_EQ(results.At("upnp").size(), 2u);
}

TEST_F(DiscoveryOrchestratorTest, SequentialMode_StopsAtDeadline) {
    config.enable_parallel_discovery = false;
    config.discovery_timeout = 500ms;
    mdns->SetDelay(2s);
    auto orchestrator = MakeOrchestrator();

    auto started = std::chrono::steady_clock::now();
    auto results = orchestrator->DiscoverAll();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, 1000ms);
    EXPECT_TRUE(results.At("mdns").empty());
    EXPECT_TRUE(results.At("upnp").empty());
    EXPECT_EQ(upnp->GetCallCount(), 0);

    auto outcomes = orchestrator->GetLastOutcomes();
    EXPECT_EQ(outcomes[1].status, HomeLens::Enums::AdapterStatus::TIMED_OUT);
}

TEST_F(DiscoveryOrchestratorTest, UnknownAndDuplicateProtocols) {
    auto orchestrator = MakeOrchestrator();
    auto results = orchestrator->DiscoverAll({"mdns", "thread", "MDNS", " mdns "});

    EXPECT_EQ(results.Protocols(), (std::vector<std::string>{"mdns", "thread"}));
    EXPECT_TRUE(results.At("thread").empty());
    EXPECT_EQ(mdns->GetCallCount(), 1);
}

TEST_F(DiscoveryOrchestratorTest, SecondCall_ServedFromCache) {
    auto orchestrator = MakeOrchestrator();
    auto first = orchestrator->DiscoverAll();
    auto second = orchestrator->DiscoverAll();

    EXPECT_EQ(first.toJson(), second.toJson());
    EXPECT_EQ(orchestrator->GetScanCount(), 1u);
    EXPECT_EQ(mdns->GetCallCount(), 1);

    // 캐시가 요청 프로토콜을 모두 포함하면 부분 요청도 캐시에서
    auto subset = orchestrator->DiscoverAll({"upnp"});
    EXPECT_EQ(subset.Protocols(), (std::vector<std::string>{"upnp"}));
    EXPECT_EQ(orchestrator->GetScanCount(), 1u);
}

TEST_F(DiscoveryOrchestratorTest, ClearCache_ForcesFreshScan) {
    auto orchestrator = MakeOrchestrator();
    orchestrator->DiscoverAll();
    orchestrator->ClearCache();
    orchestrator->DiscoverAll();

    EXPECT_EQ(orchestrator->GetScanCount(), 2u);
    EXPECT_EQ(mdns->GetCallCount(), 2);
}

TEST_F(DiscoveryOrchestratorTest, SeparateOrchestrators_DoNotShareCache) {
    auto first = MakeOrchestrator();
    auto second = MakeOrchestrator();
    first->DiscoverAll();

    EXPECT_EQ(second->GetDiscoveryStatistics().cached_devices, 0u);
    second->DiscoverAll();
    EXPECT_EQ(mdns->GetCallCount(), 2);
}

TEST_F(DiscoveryOrchestratorTest, Statistics_DescribeCachedCycle) {
    auto orchestrator = MakeOrchestrator();
    orchestrator->DiscoverAll();

    auto stats = orchestrator->GetDiscoveryStatistics();
    EXPECT_EQ(stats.cached_devices, 4u);
    EXPECT_EQ(stats.discovery_methods["upnp"], 2);
    EXPECT_EQ(stats.discovery_methods["zigbee"], 1);
    EXPECT_EQ(stats.manufacturers["Philips"], 2); // mdns 쪽은 병합으로 채워짐
    EXPECT_TRUE(stats.cache_valid);
    EXPECT_TRUE(stats.last_discovery.has_value());
}

TEST_F(DiscoveryOrchestratorTest, AllAdaptersFail_PreviousCacheKept) {
    config.cache_duration = 0s; // 매번 재탐색
    auto orchestrator = MakeOrchestrator();
    orchestrator->DiscoverAll();

    mdns->SetFailure("down");
    upnp->SetFailure("down");
    zigbee->SetFailure("down");
    auto degraded = orchestrator->DiscoverAll();

    EXPECT_EQ(degraded.TotalDevices(), 0u);
    EXPECT_EQ(orchestrator->GetDiscoveryStatistics().cached_devices, 4u);
}

TEST_F(DiscoveryOrchestratorTest, GetDeviceDetails_AttachesAdapterInfo) {
    auto mock = std::make_shared<::testing::NiceMock<MockDiscoveryAdapter>>();
    ON_CALL(*mock, Discover(_))
        .WillByDefault(Return(std::vector<RawDeviceRecord>{
            {{"id", "tv-1"}, {"ip", "10.0.0.30"}, {"name", "Roku Ultra"}}}));
    EXPECT_CALL(*mock, GetDeviceInfo("10.0.0.30", _))
        .WillOnce(Return(std::optional<json>(json{{"firmware", "11.5"}})));
    adapters->RegisterAdapter("mdns", mock);

    auto orchestrator = MakeOrchestrator();
    orchestrator->DiscoverAll({"mdns"});

    auto details = orchestrator->GetDeviceDetails("tv-1", "mdns");
    ASSERT_TRUE(details.has_value());
    ASSERT_TRUE(details->additional_info.has_value());
    EXPECT_EQ((*details->additional_info)["firmware"], "11.5");
    EXPECT_EQ(details->pattern_match->pattern_id, "roku");

    EXPECT_FALSE(orchestrator->GetDeviceDetails("missing", "mdns").has_value());
}

TEST_F(DiscoveryOrchestratorTest, GetDeviceDetails_OtherProtocolsSkipLookup) {
    auto orchestrator = MakeOrchestrator();
    orchestrator->DiscoverAll();

    auto details = orchestrator->GetDeviceDetails("0x00158d", "zigbee");
    ASSERT_TRUE(details.has_value());
    EXPECT_FALSE(details->additional_info.has_value());
    EXPECT_EQ(details->device.name, "Motion Sensor");
}

TEST_F(DiscoveryOrchestratorTest, Facade_DelegatesToOrchestrator) {
    AutoDiscoveryService service(config, adapters, DevicePatternRegistry::CreateDefault());
    auto results = service.DiscoverAllProtocols({"mdns"});
    EXPECT_EQ(results.At("mdns").size(), 1u);
    EXPECT_EQ(service.GetDiscoveryStatistics().cached_devices, 1u);

    service.ClearCache();
    EXPECT_EQ(service.GetDiscoveryStatistics().cached_devices, 0u);
    EXPECT_FALSE(service.GetDeviceDetails("hue-mdns", "mdns").has_value());
}

TEST_F(DiscoveryOrchestratorTest, CacheLifetime_StartsAfterSlowScanCompletes) {
    config.cache_duration = 1s;
    config.default_protocols = {"mdns"};
    mdns->SetDelay(1100ms);
    auto orchestrator = MakeOrchestrator();

    orchestrator->DiscoverAll();
    EXPECT_TRUE(orchestrator->GetCache().IsValid());

    orchestrator->DiscoverAll();
    EXPECT_EQ(mdns->GetCallCount(), 1);
}
