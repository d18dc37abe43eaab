/**
 * @file test_entity_correlator.cpp
 * @brief EntityCorrelator 그룹화 / 키 / 병합 테스트
 */

#include <gtest/gtest.h>
#include "Discovery/EntityCorrelator.h"
#include "Discovery/ResultNormalizer.h"
#include "Logging/LogManager.h"

using namespace HomeLens::Discovery;

class EntityCorrelatorTest : public ::testing::Test {
protected:
    ResultNormalizer normalizer;
    EntityCorrelator correlator;
    Timestamp now = Clock::now();

    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setFileOutput(false);
    }

    DiscoveryResult Make(const json& raw, const std::string& protocol) {
        return normalizer.Normalize(raw, protocol, now);
    }
};

// 동일 IP 의 mDNS / UPnP 결과는 하나의 그룹, 이름은 더 긴 쪽
TEST_F(EntityCorrelatorTest, SameIp_FormsOneGroupWithLongestName) {
    std::vector<DiscoveryResult> results = {
        Make({{"ip", "10.0.0.5"}, {"name", "Bridge"}}, "mdns"),
        Make({{"ip", "10.0.0.5"}, {"name", "Hue Bridge"}}, "upnp")};

    auto groups = correlator.Correlate(results);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].correlation_key, "ip_10.0.0.5");
    EXPECT_EQ(groups[0].Size(), 2u);

    auto enriched = correlator.Enrich(results, groups);
    ASSERT_EQ(enriched.size(), 2u);
    for (const auto& entry : enriched) {
        EXPECT_EQ(entry.device.name, "Hue Bridge");
        EXPECT_EQ(entry.correlated_protocols, (std::vector<std::string>{"mdns", "upnp"}));
        ASSERT_TRUE(entry.correlation_confidence.has_value());
        EXPECT_DOUBLE_EQ(*entry.correlation_confidence, 0.6);
    }
    EXPECT_EQ(enriched[0].device.discovery_method, "mdns");
    EXPECT_EQ(enriched[1].device.discovery_method, "upnp");
}

TEST_F(EntityCorrelatorTest, AreRelated_PrecedenceRules) {
    auto mac_a = Make({{"mac", "AA:BB:CC:DD:EE:FF"}}, "dhcp");
    auto mac_b = Make({{"mac", "aa:bb:cc:dd:ee:ff"}}, "bluetooth");
    EXPECT_TRUE(EntityCorrelator::AreRelated(mac_a, mac_b));

    auto name_a = Make({{"name", "Living Room Sonos One"}}, "mdns");
    auto name_b = Make({{"name", "living room sonos one"}}, "upnp");
    EXPECT_TRUE(EntityCorrelator::AreRelated(name_a, name_b));

    auto model_a = Make({{"name", "Hallway"}, {"manufacturer", "Philips"}, {"model", "BSB002"}}, "upnp");
    auto model_b = Make({{"name", "Bridge 2"}, {"manufacturer", "PHILIPS"}, {"model", "bsb002"}}, "zigbee");
    EXPECT_TRUE(EntityCorrelator::AreRelated(model_a, model_b));

    auto only_maker = Make({{"name", "Desk Lamp"}, {"manufacturer", "Philips"}, {"model", "LCT015"}}, "zigbee");
    EXPECT_FALSE(EntityCorrelator::AreRelated(model_a, only_maker));
}

// 이름이 없는 결과는 기본 이름이 같으므로 이름 유사도로 묶인다
TEST_F(EntityCorrelatorTest, UnnamedResults_RelateThroughDefaultName) {
    auto first = Make({{"id", "a1"}}, "mdns");
    auto second = Make({{"id", "b2"}}, "upnp");
    EXPECT_DOUBLE_EQ(EntityCorrelator::CalculateNameSimilarity(first.name, second.name), 1.0);
    EXPECT_TRUE(EntityCorrelator::AreRelated(first, second));

    std::vector<DiscoveryResult> results = {first, second};
    auto groups = correlator.Correlate(results);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].correlation_key, "name_unknown_device_unknown");

    // 병합 이름은 실제 이름이 없으면 그대로 유지
    auto enriched = correlator.Enrich(results, groups);
    EXPECT_EQ(enriched[0].device.name, "Unknown Device");
}

TEST_F(EntityCorrelatorTest, NameSimilarity_IsJaccardOverWords) {
    EXPECT_DOUBLE_EQ(EntityCorrelator::CalculateNameSimilarity("Hue Bridge", "hue bridge"), 1.0);
    EXPECT_DOUBLE_EQ(EntityCorrelator::CalculateNameSimilarity("Hue Bridge", "Hue"), 0.5);
    EXPECT_DOUBLE_EQ(EntityCorrelator::CalculateNameSimilarity("", "Hue"), 0.0);
    // 4/5 = 0.8 은 임계값을 넘지 않는다
    auto a = Make({{"name", "a b c d e"}}, "mdns");
    auto b = Make({{"name", "a b c d"}}, "upnp");
    EXPECT_FALSE(EntityCorrelator::AreRelated(a, b));
}

TEST_F(EntityCorrelatorTest, CorrelationKey_Formats) {
    EXPECT_EQ(EntityCorrelator::GenerateCorrelationKey(Make({{"ip", "192.168.1.2"}, {"mac", "AA"}}, "mdns")),
              "ip_192.168.1.2");
    EXPECT_EQ(EntityCorrelator::GenerateCorrelationKey(Make({{"mac", "AA:BB"}}, "dhcp")), "mac_aa:bb");
    EXPECT_EQ(EntityCorrelator::GenerateCorrelationKey(
                  Make({{"name", "Front Door"}, {"manufacturer", "Ring Inc"}}, "bluetooth")),
              "name_front_door_ring_inc");
    EXPECT_EQ(EntityCorrelator::GenerateCorrelationKey(Make({{"name", "Plug"}}, "zigbee")),
              "name_plug_unknown");
}

// A~B, B~C, A!~C 이면 C 는 A 그룹에 들어가지 않는다
TEST_F(EntityCorrelatorTest, Grouping_IsSeedAnchoredOneHop) {
    std::vector<DiscoveryResult> results = {
        Make({{"id", "A"}, {"ip", "10.0.0.1"}, {"name", "Alpha"}}, "mdns"),
        Make({{"id", "B"}, {"ip", "10.0.0.1"}, {"mac", "11:22:33:44:55:66"}, {"name", "Beta"}}, "upnp"),
        Make({{"id", "C"}, {"mac", "11:22:33:44:55:66"}, {"name", "Gamma"}}, "dhcp")};

    ASSERT_TRUE(EntityCorrelator::AreRelated(results[0], results[1]));
    ASSERT_TRUE(EntityCorrelator::AreRelated(results[1], results[2]));
    ASSERT_FALSE(EntityCorrelator::AreRelated(results[0], results[2]));

    auto groups = correlator.Correlate(results);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].member_indices, (std::vector<size_t>{0, 1}));
    EXPECT_EQ(groups[1].member_indices, (std::vector<size_t>{2}));
    EXPECT_EQ(groups[1].correlation_key, "mac_11:22:33:44:55:66");
}

TEST_F(EntityCorrelatorTest, KeyCollision_GetsSuffix) {
    // "Plug X" 와 "Plug_X" 는 단어 집합이 달라 관련 없지만 slug 가 같다
    std::vector<DiscoveryResult> results = {
        Make({{"name", "Plug X"}, {"manufacturer", "Acme"}, {"model", "P1"}}, "zigbee"),
        Make({{"name", "Plug_X"}, {"manufacturer", "Acme"}, {"model", "P2"}}, "bluetooth"),
        Make({{"name", "Plug x"}, {"manufacturer", "Acme"}, {"model", "P9"}}, "zigbee")};

    ASSERT_FALSE(EntityCorrelator::AreRelated(results[0], results[1]));

    auto groups = correlator.Correlate(results);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].correlation_key, "name_plug_x_acme");
    EXPECT_EQ(groups[0].member_indices, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(groups[1].correlation_key, "name_plug_x_acme#2");

    auto by_key = EntityCorrelator::ToMap(groups);
    EXPECT_EQ(by_key.size(), 2u);
    EXPECT_EQ(by_key.at("name_plug_x_acme#2").members[0].discovery_method, "bluetooth");
}

TEST_F(EntityCorrelatorTest, Merge_BackfillsFieldsAndUnionsProperties) {
    std::vector<DiscoveryResult> results = {
        Make({{"ip", "10.0.0.8"}, {"name", "Speaker"}, {"txt", "a"}, {"shared", "mdns"}}, "mdns"),
        Make({{"ip", "10.0.0.8"}, {"manufacturer", "Sonos"}, {"model", "One"}, {"mac", "00:11"},
              {"type", "speaker"}, {"shared", "upnp"}, {"location", "http://10.0.0.8:1400/xml"}},
             "upnp")};

    auto enriched = correlator.Enrich(results, correlator.Correlate(results));
    ASSERT_EQ(enriched.size(), 2u);

    const auto& mdns = enriched[0].device;
    EXPECT_EQ(mdns.manufacturer.value_or(""), "Sonos");
    EXPECT_EQ(mdns.model.value_or(""), "One");
    EXPECT_EQ(mdns.mac_address.value_or(""), "00:11");
    EXPECT_EQ(mdns.properties["shared"], "mdns");
    EXPECT_EQ(mdns.properties["location"], "http://10.0.0.8:1400/xml");
    // device_type 은 병합 대상이 아니다
    EXPECT_FALSE(mdns.device_type.has_value());

    const auto& upnp = enriched[1].device;
    EXPECT_EQ(upnp.name, "Speaker");
    EXPECT_EQ(upnp.properties["shared"], "upnp");
    EXPECT_EQ(upnp.properties["txt"], "a");
    EXPECT_EQ(upnp.device_type.value_or(""), "speaker");

    // 입력 원본은 바뀌지 않는다
    EXPECT_FALSE(results[0].manufacturer.has_value());
}

TEST_F(EntityCorrelatorTest, SingleMember_HasNoCorrelationFields) {
    std::vector<DiscoveryResult> results = {Make({{"ip", "10.0.0.3"}, {"name", "Lamp"}}, "zigbee")};
    auto enriched = correlator.Enrich(results, correlator.Correlate(results));

    ASSERT_EQ(enriched.size(), 1u);
    EXPECT_TRUE(enriched[0].correlated_protocols.empty());
    EXPECT_FALSE(enriched[0].correlation_confidence.has_value());
    EXPECT_EQ(enriched[0].correlation_key, "ip_10.0.0.3");
}

TEST_F(EntityCorrelatorTest, Confidence_IsCappedAtOne) {
    std::vector<DiscoveryResult> results;
    const char* protocols[] = {"mdns", "upnp", "dhcp", "bluetooth", "zigbee"};
    for (const char* protocol : protocols) {
        results.push_back(Make({{"ip", "10.0.0.20"}}, protocol));
    }
    auto enriched = correlator.Enrich(results, correlator.Correlate(results));
    ASSERT_TRUE(enriched[0].correlation_confidence.has_value());
    EXPECT_DOUBLE_EQ(*enriched[0].correlation_confidence, 1.0);
    EXPECT_EQ(enriched[0].correlated_protocols.size(), 5u);
}
