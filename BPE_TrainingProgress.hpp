#ifndef BPE_TRAININGPROGRESS_HPP
#define BPE_TRAININGPROGRESS_HPP

#include <functional>
#include <optional>
#include <sys/types.h>
#include <vector>

//===================================================================================================================//

namespace BPE {
  struct EpochRecord {
    ulong epoch;                                 // Zero-based
    double loss;
    double accuracy;                             // Percentage
    std::optional<double> validationLoss;
    std::optional<double> validationAccuracy;
  };

  using EpochHistory = std::vector<EpochRecord>;

  struct TrainingResult {
    double finalLoss = 0;
    double finalAccuracy = 0;
    std::optional<double> finalValidationLoss;
    std::optional<double> finalValidationAccuracy;
    ulong numTrainingSamples = 0;
    ulong numValidationSamples = 0;
    EpochHistory epochHistory;
  };

  // Called after every completed epoch.
  using TrainingCallback = std::function<void(const EpochRecord&)>;

  // Polled between epochs; returning true aborts training with TrainingCancelled.
  using CancelCheck = std::function<bool()>;

  struct TrainingHooks {
    TrainingCallback onEpoch;
    CancelCheck isCancelled;
  };
}

//===================================================================================================================//

#endif // BPE_TRAININGPROGRESS_HPP
