#ifndef BPE_FEATUREEXTRACTOR_HPP
#define BPE_FEATUREEXTRACTOR_HPP

#include "BPE_LogLevel.hpp"
#include "BPE_StatisticalScorer.hpp"
#include "BPE_Types.hpp"

#include <optional>
#include <string>
#include <vector>

//===================================================================================================================//

namespace BPE {
  // Fixed-order numeric features, each normalised to [0, 1].
  class FeatureExtractor
  {
    public:
      FeatureExtractor(StatisticalScorer& scorer, EntityDirectory& directory, LogLevel logLevel = LogLevel::ERROR);

      // Fetches the breakdown from the scorer when none is supplied.
      FeatureMap extract(const std::string& entityId, const std::string& organisationId,
                         const std::optional<RiskBreakdown>& riskBreakdown = std::nullopt, TimePoint now = Clock::now()) const;

      static FeatureMap buildFeatures(const RiskBreakdown& riskBreakdown, const EntityHistory& history, TimePoint now);

      // Throws ConfigurationError unless the names match the declared list exactly, in order.
      static Input toVector(const FeatureMap& features, const std::vector<std::string>& declaredFeatures);

      static const std::vector<std::string>& featureNames();

      //-- Normalisation caps --//
      static constexpr double daysSinceLastCertCap = 365;
      static constexpr double openActionsCap = 10;
      static constexpr double historicalBreachCap = 10;
      static constexpr double unknownAssetAge = 20;
      static constexpr double assetAgeCap = 100;

    private:
      StatisticalScorer& scorer;
      EntityDirectory& directory;
      LogLevel logLevel;
  };
}

//===================================================================================================================//

#endif // BPE_FEATUREEXTRACTOR_HPP
