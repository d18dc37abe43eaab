/**
 * @file EntityCorrelator.cpp
 * @brief 상관관계 그룹화 / 병합 구현
 */

#include "Discovery/EntityCorrelator.h"
#include "Common/Constants.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <unordered_set>

namespace HomeLens::Discovery {

namespace {

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::set<std::string> WordSet(const std::string &text) {
  std::set<std::string> words;
  std::istringstream iss(ToLower(text));
  std::string word;
  while (iss >> word) {
    words.insert(word);
  }
  return words;
}

std::string Slug(const std::optional<std::string> &value) {
  if (!value || value->empty())
    return std::string(Constants::UNKNOWN_SLUG);
  std::string slug = ToLower(*value);
  std::replace(slug.begin(), slug.end(), ' ', '_');
  return slug;
}

bool BothEqual(const std::optional<std::string> &a,
               const std::optional<std::string> &b) {
  return a && b && !a->empty() && *a == *b;
}

bool BothEqualIgnoreCase(const std::optional<std::string> &a,
                         const std::optional<std::string> &b) {
  return a && b && !a->empty() && ToLower(*a) == ToLower(*b);
}

// 멤버 값이 비어 있으면 그룹 순서상 첫 값으로 채운다
void FillFromGroup(std::optional<std::string> &field,
                   const std::vector<DiscoveryResult> &members,
                   std::optional<std::string> DiscoveryResult::*member_field) {
  if (field && !field->empty())
    return;
  for (const auto &other : members) {
    const auto &candidate = other.*member_field;
    if (candidate && !candidate->empty()) {
      field = candidate;
      return;
    }
  }
}

} // namespace

// =============================================================================
// 관계 판단
// =============================================================================

bool EntityCorrelator::IsPlaceholderName(const std::string &name) {
  return name.empty() || name == Constants::UNKNOWN_DEVICE_NAME;
}

double EntityCorrelator::CalculateNameSimilarity(const std::string &a,
                                                 const std::string &b) {
  auto words_a = WordSet(a);
  auto words_b = WordSet(b);
  if (words_a.empty() || words_b.empty())
    return 0.0;

  size_t intersection = 0;
  for (const auto &word : words_a) {
    if (words_b.count(word))
      ++intersection;
  }
  size_t union_size = words_a.size() + words_b.size() - intersection;
  return static_cast<double>(intersection) / static_cast<double>(union_size);
}

bool EntityCorrelator::AreRelated(const DiscoveryResult &a,
                                  const DiscoveryResult &b) {
  if (BothEqual(a.ip_address, b.ip_address))
    return true;

  if (BothEqualIgnoreCase(a.mac_address, b.mac_address))
    return true;

  if (CalculateNameSimilarity(a.name, b.name) >
      Constants::NAME_SIMILARITY_THRESHOLD)
    return true;

  if (BothEqualIgnoreCase(a.manufacturer, b.manufacturer) &&
      BothEqualIgnoreCase(a.model, b.model))
    return true;

  return false;
}

std::string EntityCorrelator::GenerateCorrelationKey(const DiscoveryResult &result) {
  if (result.ip_address && !result.ip_address->empty())
    return "ip_" + *result.ip_address;
  if (result.mac_address && !result.mac_address->empty())
    return "mac_" + ToLower(*result.mac_address);
  std::optional<std::string> name;
  if (!result.name.empty())
    name = result.name;
  return "name_" + Slug(name) + "_" + Slug(result.manufacturer);
}

// =============================================================================
// 그룹화
// =============================================================================

std::vector<CorrelationGroup>
EntityCorrelator::Correlate(const std::vector<DiscoveryResult> &results) const {
  std::vector<CorrelationGroup> groups;
  std::vector<bool> processed(results.size(), false);
  std::unordered_set<std::string> used_keys;

  for (size_t i = 0; i < results.size(); ++i) {
    if (processed[i])
      continue;
    processed[i] = true;

    CorrelationGroup group;
    group.members.push_back(results[i]);
    group.member_indices.push_back(i);

    for (size_t j = i + 1; j < results.size(); ++j) {
      if (processed[j])
        continue;
      // seed 와만 비교한다
      if (AreRelated(results[i], results[j])) {
        processed[j] = true;
        group.members.push_back(results[j]);
        group.member_indices.push_back(j);
      }
    }

    std::string base_key = GenerateCorrelationKey(results[i]);
    std::string key = base_key;
    for (int suffix = 2; used_keys.count(key); ++suffix) {
      key = base_key + "#" + std::to_string(suffix);
    }
    used_keys.insert(key);
    group.correlation_key = key;

    groups.push_back(std::move(group));
  }
  return groups;
}

std::map<std::string, CorrelationGroup>
EntityCorrelator::ToMap(const std::vector<CorrelationGroup> &groups) {
  std::map<std::string, CorrelationGroup> by_key;
  for (const auto &group : groups) {
    by_key.emplace(group.correlation_key, group);
  }
  return by_key;
}

// =============================================================================
// 병합
// =============================================================================

EnrichedDiscoveryResult
EntityCorrelator::MergeDeviceInformation(const DiscoveryResult &member,
                                         const CorrelationGroup &group) {
  EnrichedDiscoveryResult enriched;
  enriched.device = member;
  enriched.correlation_key = group.correlation_key;

  if (group.Size() < 2)
    return enriched;

  DiscoveryResult &device = enriched.device;

  // 이름: 그룹 내 가장 긴 실제 이름 (동률이면 먼저 나온 것)
  const std::string *best_name = nullptr;
  for (const auto &other : group.members) {
    if (IsPlaceholderName(other.name))
      continue;
    if (!best_name || other.name.size() > best_name->size())
      best_name = &other.name;
  }
  if (best_name)
    device.name = *best_name;

  FillFromGroup(device.manufacturer, group.members, &DiscoveryResult::manufacturer);
  FillFromGroup(device.model, group.members, &DiscoveryResult::model);
  FillFromGroup(device.ip_address, group.members, &DiscoveryResult::ip_address);
  FillFromGroup(device.mac_address, group.members, &DiscoveryResult::mac_address);

  // properties 합집합 (자기 키 우선)
  for (const auto &other : group.members) {
    if (!other.properties.is_object())
      continue;
    for (auto it = other.properties.begin(); it != other.properties.end(); ++it) {
      if (!device.properties.contains(it.key()))
        device.properties[it.key()] = it.value();
    }
  }

  std::set<std::string> protocols;
  for (const auto &other : group.members) {
    protocols.insert(other.discovery_method);
  }
  enriched.correlated_protocols.assign(protocols.begin(), protocols.end());
  enriched.correlation_confidence =
      std::min(Constants::MAX_CONFIDENCE,
               static_cast<double>(group.Size()) *
                   Constants::CORRELATION_WEIGHT_PER_MEMBER);
  return enriched;
}

std::vector<EnrichedDiscoveryResult>
EntityCorrelator::Enrich(const std::vector<DiscoveryResult> &results,
                         const std::vector<CorrelationGroup> &groups) const {
  std::vector<const CorrelationGroup *> group_of(results.size(), nullptr);
  for (const auto &group : groups) {
    for (size_t index : group.member_indices) {
      if (index < group_of.size())
        group_of[index] = &group;
    }
  }

  std::vector<EnrichedDiscoveryResult> enriched;
  enriched.reserve(results.size());
  for (size_t i = 0; i < results.size(); ++i) {
    if (group_of[i]) {
      enriched.push_back(MergeDeviceInformation(results[i], *group_of[i]));
    } else {
      EnrichedDiscoveryResult single;
      single.device = results[i];
      single.correlation_key = GenerateCorrelationKey(results[i]);
      enriched.push_back(std::move(single));
    }
  }
  return enriched;
}

} // namespace HomeLens::Discovery
