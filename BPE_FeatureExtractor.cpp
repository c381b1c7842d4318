#include "BPE_FeatureExtractor.hpp"
#include "BPE_Exceptions.hpp"
#include "BPE_ModelConfig.hpp"

#include <QDebug>

#include <algorithm>
#include <chrono>
#include <cmath>

using namespace BPE;

//===================================================================================================================//

namespace {
  double clamp01(double value) {
    return std::min(std::max(value, 0.0), 1.0);
  }
}

//===================================================================================================================//

FeatureExtractor::FeatureExtractor(StatisticalScorer& scorer, EntityDirectory& directory, LogLevel logLevel)
    : scorer(scorer), directory(directory), logLevel(logLevel) {
}

//===================================================================================================================//

FeatureMap FeatureExtractor::extract(const std::string& entityId, const std::string& organisationId,
                                     const std::optional<RiskBreakdown>& riskBreakdown, TimePoint now) const {
  RiskBreakdown breakdown = riskBreakdown ? *riskBreakdown : this->scorer.computeStatisticalScore(entityId, organisationId);
  EntityHistory history = this->directory.getHistory(entityId, organisationId);

  FeatureMap features = FeatureExtractor::buildFeatures(breakdown, history, now);

  if (this->logLevel >= LogLevel::DEBUG) {
    qDebug() << "features extracted entity=" << QString::fromStdString(entityId) << "count=" << features.size();
  }

  return features;
}

//===================================================================================================================//

FeatureMap FeatureExtractor::buildFeatures(const RiskBreakdown& riskBreakdown, const EntityHistory& history, TimePoint now) {
  double daysSinceLastCert = daysSinceLastCertCap;

  if (history.lastCertificateIssued) {
    auto elapsed = std::chrono::duration_cast<std::chrono::hours>(now - *history.lastCertificateIssued).count();
    daysSinceLastCert = std::floor(static_cast<double>(elapsed) / 24.0);
  }

  const FactorBreakdown& factors = riskBreakdown.factorBreakdown;
  double assetAge = factors.assetAge ? *factors.assetAge : unknownAssetAge;

  return {
    {"expiryRiskScore", riskBreakdown.expiryRiskScore / 100.0},
    {"defectRiskScore", riskBreakdown.defectRiskScore / 100.0},
    {"assetProfileRiskScore", riskBreakdown.assetProfileRiskScore / 100.0},
    {"coverageGapRiskScore", riskBreakdown.coverageGapRiskScore / 100.0},
    {"externalFactorRiskScore", riskBreakdown.externalFactorRiskScore / 100.0},
    {"daysSinceLastCert", clamp01(daysSinceLastCert / daysSinceLastCertCap)},
    {"openActionsCount", clamp01(static_cast<double>(history.openActions) / openActionsCap)},
    {"historicalBreachCount", clamp01(static_cast<double>(history.historicalBreaches) / historicalBreachCap)},
    {"propertyAge", clamp01(assetAge / assetAgeCap)},
    {"isHRB", factors.isHRB ? 1.0 : 0.0},
    {"hasVulnerableOccupants", factors.hasVulnerableOccupants ? 1.0 : 0.0}
  };
}

//===================================================================================================================//

Input FeatureExtractor::toVector(const FeatureMap& features, const std::vector<std::string>& declaredFeatures) {
  if (features.size() != declaredFeatures.size()) {
    throw ConfigurationError("extracted " + std::to_string(features.size()) + " features, model declares " +
                             std::to_string(declaredFeatures.size()));
  }

  Input input;
  input.reserve(features.size());

  for (ulong i = 0; i < features.size(); i++) {
    if (features[i].first != declaredFeatures[i]) {
      throw ConfigurationError("feature " + std::to_string(i) + " is '" + features[i].first + "', model declares '" +
                               declaredFeatures[i] + "'");
    }

    input.push_back(features[i].second);
  }

  return input;
}

//===================================================================================================================//

const std::vector<std::string>& FeatureExtractor::featureNames() {
  static const std::vector<std::string> names = ModelConfig::defaults().inputFeatures;

  return names;
}

//===================================================================================================================//
