#ifndef BPE_BLENDINGENGINE_HPP
#define BPE_BLENDINGENGINE_HPP

#include "BPE_Enums.hpp"
#include "BPE_Types.hpp"

#include <optional>

//===================================================================================================================//

namespace BPE {
  struct BlendResult {
    int combinedScore = 0;
    int combinedConfidence = 0;
    RiskCategory riskCategory = RiskCategory::LOW;
    SourceLabel sourceLabel = SourceLabel::STATISTICAL;
    std::optional<int> daysToBreach;
    std::optional<TimePoint> predictedBreachDate;
  };

  // Confidence-weighted merge of the statistical score with an optional ML score.
  class BlendingEngine
  {
    public:
      static BlendResult blend(double statScore, double statConfidence, std::optional<double> mlScore,
                               std::optional<double> mlConfidence, TimePoint now = Clock::now());

      // >= 85 CRITICAL, >= 70 HIGH, >= 40 MEDIUM, else LOW
      static RiskCategory categorize(int combinedScore);

      // Empty below 40.
      static std::optional<int> projectDaysToBreach(int combinedScore);
  };
}

//===================================================================================================================//

#endif // BPE_BLENDINGENGINE_HPP
