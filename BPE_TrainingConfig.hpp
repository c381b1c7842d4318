#ifndef BPE_TRAININGCONFIG_HPP
#define BPE_TRAININGCONFIG_HPP

#include <optional>
#include <sys/types.h>

//===================================================================================================================//

namespace BPE {
  struct TrainingConfig {
    double learningRate = 0.01;
    ulong epochs = 100;
    ulong batchSize = 32;         // Honoured by the tensor backend only
    double validationSplit = 0.2; // Trailing fraction held out by the tensor backend
  };

  // Partial override supplied by a caller of triggerTraining / updateModelSettings.
  struct TrainingOverrides {
    std::optional<double> learningRate;
    std::optional<ulong> epochs;
    std::optional<ulong> batchSize;
    std::optional<double> validationSplit;

    TrainingConfig applyTo(TrainingConfig config) const {
      if (this->learningRate) config.learningRate = *this->learningRate;
      if (this->epochs) config.epochs = *this->epochs;
      if (this->batchSize) config.batchSize = *this->batchSize;
      if (this->validationSplit) config.validationSplit = *this->validationSplit;

      return config;
    }
  };
}

//===================================================================================================================//

#endif // BPE_TRAININGCONFIG_HPP
