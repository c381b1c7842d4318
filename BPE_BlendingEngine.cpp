#include "BPE_BlendingEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

using namespace BPE;

//===================================================================================================================//

BlendResult BlendingEngine::blend(double statScore, double statConfidence, std::optional<double> mlScore,
                                  std::optional<double> mlConfidence, TimePoint now) {
  BlendResult result;

  if (!mlScore || !mlConfidence) {
    result.combinedScore = static_cast<int>(std::round(statScore));
    result.combinedConfidence = static_cast<int>(std::round(statConfidence));
    result.sourceLabel = SourceLabel::STATISTICAL;
  } else {
    double totalConfidence = statConfidence + *mlConfidence;

    // Two zero confidences carry no preference, weight both scores equally.
    double statWeight = (totalConfidence > 0) ? statConfidence / totalConfidence : 0.5;
    double mlWeight = (totalConfidence > 0) ? *mlConfidence / totalConfidence : 0.5;

    result.combinedScore = static_cast<int>(std::round(statScore * statWeight + *mlScore * mlWeight));
    result.combinedConfidence = static_cast<int>(std::round(totalConfidence / 2.0));
    result.sourceLabel = SourceLabel::ML_ENHANCED;
  }

  result.riskCategory = BlendingEngine::categorize(result.combinedScore);
  result.daysToBreach = BlendingEngine::projectDaysToBreach(result.combinedScore);

  if (result.daysToBreach) {
    result.predictedBreachDate = now + std::chrono::hours(24 * *result.daysToBreach);
  }

  return result;
}

//===================================================================================================================//

RiskCategory BlendingEngine::categorize(int combinedScore) {
  if (combinedScore >= 85) {
    return RiskCategory::CRITICAL;
  }

  if (combinedScore >= 70) {
    return RiskCategory::HIGH;
  }

  if (combinedScore >= 40) {
    return RiskCategory::MEDIUM;
  }

  return RiskCategory::LOW;
}

//===================================================================================================================//

std::optional<int> BlendingEngine::projectDaysToBreach(int combinedScore) {
  if (combinedScore >= 70) {
    return std::max(1, static_cast<int>(std::round((100 - combinedScore) * 3.0)));
  }

  if (combinedScore >= 40) {
    return static_cast<int>(std::round(30 + (100 - combinedScore) * 2.0));
  }

  return std::nullopt;
}

//===================================================================================================================//
