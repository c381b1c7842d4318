#ifndef BPE_MODELCONFIG_HPP
#define BPE_MODELCONFIG_HPP

#include "BPE_ActvFunc.hpp"

#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

//===================================================================================================================//

namespace BPE {
  using FeatureWeights = std::vector<std::pair<std::string, double>>;

  struct ModelConfig {
    std::vector<std::string> inputFeatures;
    std::vector<ulong> hiddenLayers;        // Native backend
    std::vector<ulong> tensorHiddenLayers;  // Tensor backend
    ulong outputSize = 1;
    ActvFuncType outputActivation = ActvFuncType::SIGMOID;

    // Full layer sizes for the given hidden layers: input, hidden..., output.
    std::vector<ulong> layerSizes(const std::vector<ulong>& hidden) const {
      std::vector<ulong> sizes;
      sizes.push_back(this->inputFeatures.size());
      sizes.insert(sizes.end(), hidden.begin(), hidden.end());
      sizes.push_back(this->outputSize);

      return sizes;
    }

    static ModelConfig defaults() {
      ModelConfig config;
      config.inputFeatures = {
        "expiryRiskScore",
        "defectRiskScore",
        "assetProfileRiskScore",
        "coverageGapRiskScore",
        "externalFactorRiskScore",
        "daysSinceLastCert",
        "openActionsCount",
        "historicalBreachCount",
        "propertyAge",
        "isHRB",
        "hasVulnerableOccupants"
      };
      config.hiddenLayers = {16, 8};
      config.tensorHiddenLayers = {64, 32};

      return config;
    }

    static FeatureWeights defaultFeatureWeights() {
      return {
        {"expiryRiskScore", 0.25},
        {"defectRiskScore", 0.20},
        {"assetProfileRiskScore", 0.15},
        {"coverageGapRiskScore", 0.15},
        {"externalFactorRiskScore", 0.10},
        {"daysSinceLastCert", 0.05},
        {"openActionsCount", 0.05},
        {"historicalBreachCount", 0.05}
      };
    }
  };
}

//===================================================================================================================//

#endif // BPE_MODELCONFIG_HPP
