#ifndef BPE_ENGINE_HPP
#define BPE_ENGINE_HPP

#include "BPE_EngineConfig.hpp"
#include "BPE_FeedbackStore.hpp"
#include "BPE_MemoryRepository.hpp"
#include "BPE_ModelCache.hpp"
#include "BPE_ModelRegistry.hpp"
#include "BPE_PredictionService.hpp"
#include "BPE_TrainingOrchestrator.hpp"

#include <QFuture>

#include <memory>
#include <optional>
#include <string>
#include <vector>

//===================================================================================================================//

namespace BPE {
  // Wires the services over one repository and one model cache.
  class Engine
  {
    public:
      Engine(StatisticalScorer& scorer, EntityDirectory& directory, const EngineConfig& engineConfig = EngineConfig(),
             std::shared_ptr<MemoryRepository> repository = nullptr);

      //-- Predictions --//
      Prediction predictBreach(const std::string& entityId, const std::string& organisationId, bool isTest = false);
      std::vector<Prediction> predictBatch(const std::vector<std::string>& entityIds, const std::string& organisationId);
      std::vector<Prediction> runTestPredictions(const std::string& organisationId, ulong limit = defaultTestPredictions);
      FeatureMap extractFeatures(const std::string& entityId, const std::string& organisationId) const;
      Prediction recordOutcome(const std::string& predictionId, const std::string& actualOutcome,
                               const std::optional<TimePoint>& actualBreachDate = std::nullopt,
                               const std::optional<bool>& wasAccurate = std::nullopt);
      std::vector<Prediction> listPredictions(const std::string& organisationId, ulong limit = defaultListLimit,
                                              bool includeTest = false) const;

      //-- Feedback --//
      Feedback submitFeedback(const FeedbackRequest& request);
      ModelMetrics getModelMetrics(const std::string& organisationId);

      //-- Training --//
      TrainingOutcome triggerTraining(const std::string& organisationId, const TrainingOverrides& overrides = TrainingOverrides());
      QFuture<TrainingOutcome> startTraining(const std::string& organisationId, const TrainingOverrides& overrides = TrainingOverrides());
      bool cancelTraining(const std::string& modelId);
      std::vector<TrainingRun> listTrainingRuns(const std::string& organisationId, ulong limit = defaultTrainingRunsLimit) const;
      TrainingRun getTrainingRun(const std::string& runId) const;

      //-- Settings --//
      Model updateModelSettings(const std::string& organisationId, const ModelSettings& settings);
      Model getModel(const std::string& organisationId);

      //-- Snapshots --//
      void saveSnapshot(const std::string& filePath) const;
      void loadSnapshot(const std::string& filePath);

      //-- Getters --//
      const EngineConfig& getEngineConfig() const { return this->engineConfig; }
      std::shared_ptr<MemoryRepository> getRepository() const { return this->repository; }
      std::shared_ptr<ModelCache> getModelCache() const { return this->modelCache; }
      PredictionService& getPredictionService() { return this->predictionService; }
      TrainingOrchestrator& getTrainingOrchestrator() { return this->trainingOrchestrator; }

      static constexpr ulong defaultTestPredictions = 30;
      static constexpr ulong defaultListLimit = 50;
      static constexpr ulong defaultTrainingRunsLimit = 20;

    private:
      EngineConfig engineConfig;
      std::shared_ptr<MemoryRepository> repository;
      std::shared_ptr<ModelCache> modelCache;
      ModelRegistry modelRegistry;
      PredictionService predictionService;
      FeedbackStore feedbackStore;
      TrainingOrchestrator trainingOrchestrator;
  };
}

//===================================================================================================================//

#endif // BPE_ENGINE_HPP
