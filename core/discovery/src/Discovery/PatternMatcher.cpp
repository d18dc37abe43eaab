/**
 * @file PatternMatcher.cpp
 * @brief 패턴 점수 계산 구현
 */

#include "Discovery/PatternMatcher.h"
#include "Common/Constants.h"

#include <algorithm>
#include <cctype>

namespace HomeLens::Discovery {

namespace {

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool ContainsAnyKeyword(const std::vector<std::string> &keywords,
                        const std::string &field, const std::string &name) {
  for (const auto &raw_keyword : keywords) {
    std::string keyword = ToLower(raw_keyword);
    if (keyword.empty())
      continue;
    if (field.find(keyword) != std::string::npos ||
        name.find(keyword) != std::string::npos)
      return true;
  }
  return false;
}

} // namespace

PatternMatcher::PatternMatcher(std::shared_ptr<const DevicePatternRegistry> patterns)
    : patterns_(std::move(patterns)) {}

bool PatternMatcher::HasServiceEvidence(const json &properties,
                                        const std::string &service) {
  if (service.empty() || !properties.is_object())
    return false;
  if (properties.contains(service))
    return true;
  for (const auto &value : properties) {
    if (value.is_string() && value.get_ref<const std::string &>() == service)
      return true;
  }
  return false;
}

double PatternMatcher::ScorePattern(const DiscoveryResult &result,
                                    const DevicePattern &pattern) {
  const std::string name = ToLower(result.name);
  const std::string manufacturer = ToLower(result.manufacturer.value_or(""));
  const std::string model = ToLower(result.model.value_or(""));

  double score = 0.0;
  if (ContainsAnyKeyword(pattern.manufacturer_keywords, manufacturer, name))
    score += Constants::PATTERN_MANUFACTURER_WEIGHT;
  if (ContainsAnyKeyword(pattern.model_keywords, model, name))
    score += Constants::PATTERN_MODEL_WEIGHT;
  if (HasServiceEvidence(result.properties, pattern.mdns_service) ||
      HasServiceEvidence(result.properties, pattern.upnp_device_type))
    score += Constants::PATTERN_SERVICE_WEIGHT;

  return std::min(score, Constants::MAX_CONFIDENCE);
}

std::optional<PatternMatch>
PatternMatcher::Match(const DiscoveryResult &result) const {
  if (!patterns_)
    return std::nullopt;

  std::optional<PatternMatch> best;
  double best_score = 0.0;
  for (const auto &pattern : patterns_->GetPatterns()) {
    double score = ScorePattern(result, pattern);
    // strict > : 먼저 선언된 패턴이 동점에서 이긴다
    if (score > best_score) {
      best_score = score;
      best = PatternMatch{pattern.pattern_id, score, pattern};
    }
  }

  if (best_score > Constants::PATTERN_MATCH_THRESHOLD)
    return best;
  return std::nullopt;
}

bool PatternMatcher::Apply(EnrichedDiscoveryResult &enriched) const {
  auto match = Match(enriched.device);
  if (!match)
    return false;
  enriched.device.confidence_score = match->confidence;
  enriched.pattern_match = std::move(match);
  return true;
}

} // namespace HomeLens::Discovery
