#ifndef BPE_FEEDBACKSTORE_HPP
#define BPE_FEEDBACKSTORE_HPP

#include "BPE_LogLevel.hpp"
#include "BPE_ModelRegistry.hpp"
#include "BPE_Repository.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

//===================================================================================================================//

namespace BPE {
  struct FeedbackStats {
    ulong total = 0;
    ulong correct = 0;
    ulong incorrect = 0;
    ulong partiallyCorrect = 0;
  };

  struct ModelMetrics {
    std::string modelId;
    ModelStatus status = ModelStatus::TRAINING;
    std::optional<double> accuracy;  // Fraction, correct / (correct + incorrect) feedback
    ulong totalPredictions = 0;
    ulong correctPredictions = 0;
    std::optional<double> trainingAccuracy;
    std::optional<TimePoint> lastTrainedAt;
    FeedbackStats feedbackStats;
    bool trainingReady = false;
    std::vector<TrainingRun> recentTrainingRuns;
  };

  struct FeedbackRequest {
    std::string predictionId;
    std::string organisationId;
    FeedbackType feedbackType = FeedbackType::CORRECT;
    std::optional<double> correctedScore;
    std::optional<RiskCategory> correctedCategory;
    std::string notes;
    std::string submittedBy;
  };

  class FeedbackStore
  {
    public:
      FeedbackStore(std::shared_ptr<Repository> repository, ModelRegistry& modelRegistry, ulong minTrainingExamples = 10,
                    LogLevel logLevel = LogLevel::ERROR);

      // Resubmitting the same content for a prediction returns the stored row and leaves the model counters alone.
      Feedback submitFeedback(const FeedbackRequest& request);

      ModelMetrics getModelMetrics(const std::string& organisationId,
                                   PredictionType predictionType = PredictionType::BREACH_PROBABILITY);

      static constexpr ulong recentRunsLimit = 10;

    private:
      std::shared_ptr<Repository> repository;
      ModelRegistry& modelRegistry;
      ulong minTrainingExamples;
      LogLevel logLevel;
  };
}

//===================================================================================================================//

#endif // BPE_FEEDBACKSTORE_HPP
