/**
 * @file test_discovery_cache.cpp
 * @brief DiscoveryCache TTL / 교체 / 조회 / 통계 테스트
 */

#include <gtest/gtest.h>
#include "Discovery/DiscoveryCache.h"

using namespace HomeLens::Discovery;
using namespace std::chrono_literals;

namespace {

EnrichedDiscoveryResult Device(const std::string& id, const std::string& method,
                               const std::string& type, const std::string& manufacturer) {
    EnrichedDiscoveryResult entry;
    entry.device.device_id = id;
    entry.device.name = id;
    entry.device.discovery_method = method;
    if (!type.empty()) entry.device.device_type = type;
    if (!manufacturer.empty()) entry.device.manufacturer = manufacturer;
    return entry;
}

ProtocolResultMap SampleResults() {
    ProtocolResultMap results;
    results.Set("mdns", {Device("hue-1", "mdns", "bridge", "Philips"),
                         Device("sonos-1", "mdns", "speaker", "Sonos")});
    results.Set("upnp", {Device("hue-1", "upnp", "bridge", "Philips")});
    results.Set("zigbee", {});
    return results;
}

} // namespace

TEST(DiscoveryCacheTest, EmptyCache_IsInvalid) {
    DiscoveryCache cache(300s);
    EXPECT_FALSE(cache.IsValid());
    EXPECT_FALSE(cache.GetIfValid().has_value());
    EXPECT_TRUE(cache.Get().Empty());
    EXPECT_FALSE(cache.GetLastDiscoveryTime().has_value());

    auto stats = cache.BuildStatistics();
    EXPECT_EQ(stats.cached_devices, 0u);
    EXPECT_FALSE(stats.last_discovery.has_value());
    EXPECT_FALSE(stats.cache_valid);
}

TEST(DiscoveryCacheTest, Validity_FollowsDuration) {
    DiscoveryCache cache(300s);
    auto filled_at = Clock::now();
    cache.Update(SampleResults(), filled_at);

    EXPECT_TRUE(cache.IsValid(filled_at + 299s));
    EXPECT_FALSE(cache.IsValid(filled_at + 300s));
    EXPECT_FALSE(cache.IsValid(filled_at + 1h));
}

TEST(DiscoveryCacheTest, ZeroDuration_DisablesCaching) {
    DiscoveryCache cache(0s);
    cache.Update(SampleResults());
    EXPECT_FALSE(cache.IsValid());
    // 상세 조회용 인덱스는 유지
    EXPECT_TRUE(cache.FindDevice("sonos-1").has_value());
}

TEST(DiscoveryCacheTest, Get_ReturnsWholeSnapshotInOrder) {
    DiscoveryCache cache(300s);
    cache.Update(SampleResults());

    auto cached = cache.GetIfValid();
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->Protocols(), (std::vector<std::string>{"mdns", "upnp", "zigbee"}));
    EXPECT_EQ(cached->At("mdns").size(), 2u);
    EXPECT_TRUE(cached->At("zigbee").empty());
    EXPECT_EQ(cached->toJson(), SampleResults().toJson());
}

TEST(DiscoveryCacheTest, Update_ReplacesWholesale) {
    DiscoveryCache cache(300s);
    cache.Update(SampleResults());

    ProtocolResultMap next;
    next.Set("dhcp", {Device("plug-1", "dhcp", "", "")});
    cache.Update(next);

    EXPECT_FALSE(cache.FindDevice("hue-1").has_value());
    EXPECT_TRUE(cache.FindDevice("plug-1").has_value());
    EXPECT_EQ(cache.Get().Protocols(), (std::vector<std::string>{"dhcp"}));
}

TEST(DiscoveryCacheTest, FindDevice_LastWriterWins) {
    DiscoveryCache cache(300s);
    cache.Update(SampleResults());

    auto hue = cache.FindDevice("hue-1");
    ASSERT_TRUE(hue.has_value());
    EXPECT_EQ(hue->device.discovery_method, "upnp");
    EXPECT_EQ(cache.GetDeviceCount(), 2u);
}

TEST(DiscoveryCacheTest, Clear_PurgesEverything) {
    DiscoveryCache cache(300s);
    cache.Update(SampleResults());
    cache.Clear();

    EXPECT_FALSE(cache.IsValid());
    EXPECT_FALSE(cache.FindDevice("hue-1").has_value());
    EXPECT_EQ(cache.BuildStatistics().cached_devices, 0u);
}

TEST(DiscoveryCacheTest, Statistics_CountsIndexedDevices) {
    DiscoveryCache cache(300s);
    auto filled_at = Clock::now();
    cache.Update(SampleResults(), filled_at);

    auto stats = cache.BuildStatistics(filled_at + 10s);
    EXPECT_EQ(stats.cached_devices, 2u);
    EXPECT_TRUE(stats.cache_valid);
    ASSERT_TRUE(stats.cache_age_seconds.has_value());
    EXPECT_NEAR(*stats.cache_age_seconds, 10.0, 0.001);
    EXPECT_EQ(stats.discovery_methods["upnp"], 1);
    EXPECT_EQ(stats.discovery_methods["mdns"], 1);
    EXPECT_EQ(stats.device_types["bridge"], 1);
    EXPECT_EQ(stats.manufacturers["Sonos"], 1);

    auto j = stats.toJson();
    EXPECT_EQ(j["cached_devices"], 2);
    EXPECT_TRUE(j["last_discovery"].is_string());
}

TEST(DiscoveryCacheTest, Statistics_SkipsAbsentTypeAndManufacturer) {
    DiscoveryCache cache(300s);
    ProtocolResultMap results;
    results.Set("zigbee", {Device("sensor-1", "zigbee", "", "")});
    cache.Update(results);

    auto stats = cache.BuildStatistics();
    EXPECT_EQ(stats.cached_devices, 1u);
    EXPECT_EQ(stats.discovery_methods["zigbee"], 1);
    EXPECT_TRUE(stats.device_types.empty());
    EXPECT_TRUE(stats.manufacturers.empty());
}

TEST(ProtocolResultMapTest, ToJson_KeepsProtocolOrderAndDeviceObjects) {
    auto j = SampleResults().toJson();

    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"mdns", "upnp", "zigbee"}));

    ASSERT_TRUE(j["mdns"].is_array());
    ASSERT_EQ(j["mdns"].size(), 2u);
    EXPECT_TRUE(j["mdns"][0].is_object());
    EXPECT_EQ(j["mdns"][0]["device_id"], "hue-1");
    EXPECT_EQ(j["mdns"][1]["manufacturer"], "Sonos");
    EXPECT_TRUE(j["zigbee"].is_array());
    EXPECT_TRUE(j["zigbee"].empty());
}
