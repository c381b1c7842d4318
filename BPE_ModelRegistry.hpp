#ifndef BPE_MODELREGISTRY_HPP
#define BPE_MODELREGISTRY_HPP

#include "BPE_EngineConfig.hpp"
#include "BPE_Repository.hpp"

#include <memory>
#include <optional>
#include <string>

//===================================================================================================================//

namespace BPE {
  struct ModelSettings {
    TrainingOverrides training;
    std::optional<FeatureWeights> featureWeights;
  };

  // Lifecycle of the single active model per (organisation, prediction type).
  class ModelRegistry
  {
    public:
      ModelRegistry(std::shared_ptr<Repository> repository, const EngineConfig& engineConfig);

      Model getOrCreate(const std::string& organisationId, PredictionType predictionType = PredictionType::BREACH_PROBABILITY);
      std::optional<Model> findActive(const std::string& organisationId,
                                      PredictionType predictionType = PredictionType::BREACH_PROBABILITY) const;
      Model get(const std::string& modelId) const;

      //-- Counters --//
      Model recordPrediction(const std::string& modelId);
      Model recordFeedback(const std::string& modelId, FeedbackType feedbackType);

      // Validates before writing: positive learning rate, epochs and batch size, known feature names.
      Model updateSettings(const std::string& organisationId, const ModelSettings& settings,
                           PredictionType predictionType = PredictionType::BREACH_PROBABILITY);

      // Throws ConfigurationError unless the learning rate is positive and finite, epochs and batch size are positive
      // and the validation split lies in [0, 1).
      static void validateTrainingConfig(const TrainingConfig& trainingConfig);

      // Swaps in trained weights, bumps the weights revision and flips the model to ACTIVE.
      static void applyTrainedWeights(Model& model, const SerializedWeights& weights, const TrainingResult& trainingResult,
                                      ulong numSamples);

      Model makeModel(const std::string& organisationId, PredictionType predictionType) const;

    private:
      std::shared_ptr<Repository> repository;
      EngineConfig engineConfig;
  };
}

//===================================================================================================================//

#endif // BPE_MODELREGISTRY_HPP
