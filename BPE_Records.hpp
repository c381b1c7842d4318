#ifndef BPE_RECORDS_HPP
#define BPE_RECORDS_HPP

#include "BPE_Enums.hpp"
#include "BPE_ModelConfig.hpp"
#include "BPE_TrainingConfig.hpp"
#include "BPE_TrainingProgress.hpp"
#include "BPE_Types.hpp"
#include "BPE_WeightsFormat.hpp"

#include <optional>
#include <string>
#include <sys/types.h>

//===================================================================================================================//

namespace BPE {
  // One per (organisation, prediction type) while active. Updated in place by training, never re-created.
  struct Model {
    std::string id;
    std::string organisationId;
    std::string name;
    PredictionType predictionType = PredictionType::BREACH_PROBABILITY;
    ulong version = 1;
    ModelStatus status = ModelStatus::TRAINING;
    bool isActive = true;

    ModelConfig modelConfig;
    SerializedWeights weights;
    ulong weightsRevision = 0;  // Bumped on every weight swap, used to invalidate cached backends

    TrainingConfig trainingConfig;
    FeatureWeights featureWeights;

    //-- Aggregate metrics --//
    ulong totalPredictions = 0;
    ulong correctPredictions = 0;
    ulong feedbackCount = 0;
    std::optional<TimePoint> lastTrainedAt;
    std::optional<double> trainingAccuracy;
    std::optional<double> validationAccuracy;
    std::optional<double> trainingLoss;
    std::optional<double> validationLoss;
    ulong trainingProgress = 0;
    ulong trainingSamples = 0;

    TimePoint createdAt;
    TimePoint updatedAt;

    bool hasUsableWeights() const { return this->status == ModelStatus::ACTIVE && !this->weights.empty(); }
  };

  // Audit record of a single inference. Only the observed outcome may be attached later.
  struct Prediction {
    std::string id;
    std::string organisationId;
    std::string modelId;
    std::string entityId;
    PredictionType predictionType = PredictionType::BREACH_PROBABILITY;

    double statisticalScore = 0;
    double statisticalConfidence = 0;
    std::optional<double> mlScore;
    std::optional<double> mlConfidence;
    std::optional<std::string> backendName;

    int combinedScore = 0;
    int combinedConfidence = 0;
    RiskCategory riskCategory = RiskCategory::LOW;
    SourceLabel sourceLabel = SourceLabel::STATISTICAL;
    std::optional<int> daysToBreach;
    std::optional<TimePoint> predictedBreachDate;

    FeatureMap inputFeatures;

    //-- Outcome --//
    std::optional<std::string> actualOutcome;
    std::optional<TimePoint> actualBreachDate;
    std::optional<bool> wasAccurate;

    bool isTest = false;
    TimePoint createdAt;
    TimePoint expiresAt;
  };

  struct Feedback {
    std::string id;
    std::string organisationId;
    std::string predictionId;
    std::string modelId;
    FeedbackType feedbackType = FeedbackType::CORRECT;
    std::optional<double> correctedScore;
    std::optional<RiskCategory> correctedCategory;
    std::string notes;
    std::string submittedBy;
    bool usedForTraining = false;
    std::optional<std::string> trainingBatchId;
    TimePoint createdAt;

    // Same submission content, ignoring identity and bookkeeping.
    bool sameSubmission(const Feedback& other) const {
      return this->predictionId == other.predictionId && this->feedbackType == other.feedbackType &&
             this->correctedScore == other.correctedScore && this->correctedCategory == other.correctedCategory &&
             this->notes == other.notes;
    }
  };

  // TRAINING -> ACTIVE | FAILED, terminal.
  struct TrainingRun {
    std::string id;
    std::string organisationId;
    std::string modelId;
    ModelStatus status = ModelStatus::TRAINING;
    TrainingConfig trainingConfig;
    std::optional<std::string> backendName;

    ulong currentEpoch = 0;
    ulong progress = 0;  // Percentage
    ulong trainingSamples = 0;
    ulong validationSamples = 0;

    std::optional<double> finalAccuracy;
    std::optional<double> finalLoss;
    std::optional<double> finalValidationAccuracy;
    std::optional<double> finalValidationLoss;
    EpochHistory epochHistory;

    TimePoint startedAt;
    std::optional<TimePoint> completedAt;
    std::optional<std::string> errorMessage;

    bool isTerminal() const { return this->status == ModelStatus::ACTIVE || this->status == ModelStatus::FAILED; }
  };
}

//===================================================================================================================//

#endif // BPE_RECORDS_HPP
